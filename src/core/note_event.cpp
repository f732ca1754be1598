/**
 * @file note_event.cpp
 * @brief NoteEvent validation and hashing.
 */

#include "core/note_event.h"

#include <functional>
#include <limits>
#include <sstream>

namespace mididiff {

std::optional<NoteEvent> NoteEvent::create(int64_t pitch, int64_t start, int64_t duration,
                                           int64_t velocity) {
  constexpr int64_t kMaxTick = std::numeric_limits<Tick>::max();

  if (pitch < 0 || pitch > kMaxMidiDataValue) return std::nullopt;
  if (velocity < 0 || velocity > kMaxMidiDataValue) return std::nullopt;
  if (start < 0 || start > kMaxTick) return std::nullopt;
  if (duration < 1 || duration > kMaxTick - start) return std::nullopt;

  return NoteEvent(static_cast<uint8_t>(pitch), static_cast<Tick>(start),
                   static_cast<Tick>(duration), static_cast<uint8_t>(velocity));
}

std::string NoteEvent::toString() const {
  std::ostringstream oss;
  oss << "Note(p=" << static_cast<int>(pitch_) << ", start=" << start_ << ", dur=" << duration_
      << ", vel=" << static_cast<int>(velocity_) << ")";
  return oss.str();
}

size_t NoteEventHash::operator()(const NoteEvent& note) const {
  // pitch fits in 7 bits; fold start and duration around it
  uint64_t key = (static_cast<uint64_t>(note.start()) << 32) | note.duration();
  size_t seed = std::hash<uint64_t>{}(key);
  seed ^= std::hash<uint32_t>{}(note.pitch()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  return seed;
}

}  // namespace mididiff
