/**
 * @file note_event.h
 * @brief Validated, immutable note record used by the diff engine.
 */

#ifndef MIDIDIFF_CORE_NOTE_EVENT_H
#define MIDIDIFF_CORE_NOTE_EVENT_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/basic_types.h"

namespace mididiff {

/// @brief One sounded note (combines note-on/off).
///
/// Identity (equality and hash) is the (pitch, start, duration) triple.
/// Velocity is carried along but never compared, so two notes that differ
/// only in velocity are the same note for diffing.
class NoteEvent {
 public:
  /**
   * @brief Create a note, rejecting out-of-range values.
   * @param pitch MIDI note number (0-127)
   * @param start Absolute start tick (>= 0)
   * @param duration Length in ticks (>= 1)
   * @param velocity Note-on velocity (0-127)
   * @return NoteEvent, or std::nullopt if any field is out of range or the
   *         end tick does not fit in a Tick
   */
  static std::optional<NoteEvent> create(int64_t pitch, int64_t start, int64_t duration,
                                         int64_t velocity);

  uint8_t pitch() const { return pitch_; }
  Tick start() const { return start_; }
  Tick duration() const { return duration_; }
  uint8_t velocity() const { return velocity_; }

  /// @brief Tick at which the note is released (start + duration).
  Tick endTick() const { return start_ + duration_; }

  /// @brief Check identity against another note (velocity ignored).
  bool sameIdentity(const NoteEvent& other) const {
    return pitch_ == other.pitch_ && start_ == other.start_ && duration_ == other.duration_;
  }

  bool operator==(const NoteEvent& other) const { return sameIdentity(other); }
  bool operator!=(const NoteEvent& other) const { return !sameIdentity(other); }

  /// @brief Human-readable form, e.g. "Note(p=60, start=0, dur=10, vel=100)".
  std::string toString() const;

 private:
  NoteEvent(uint8_t pitch, Tick start, Tick duration, uint8_t velocity)
      : pitch_(pitch), start_(start), duration_(duration), velocity_(velocity) {}

  uint8_t pitch_;
  Tick start_;
  Tick duration_;
  uint8_t velocity_;
};

/// @brief Hash over the identity key, for unordered containers.
struct NoteEventHash {
  size_t operator()(const NoteEvent& note) const;
};

}  // namespace mididiff

#endif  // MIDIDIFF_CORE_NOTE_EVENT_H
