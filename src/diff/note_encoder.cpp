/**
 * @file note_encoder.cpp
 * @brief Implementation of note to message encoding.
 */

#include "diff/note_encoder.h"

#include <algorithm>

namespace mididiff {

namespace {

// Order key at equal ticks: note-off (0) sorts before note-on (1)
constexpr uint8_t kNoteOffRank = 0;
constexpr uint8_t kNoteOnRank = 1;

struct AbsoluteEvent {
  Tick tick;
  uint8_t rank;
  uint8_t pitch;
  uint8_t velocity;
};

}  // namespace

EncodedTrack encodeNotes(const std::vector<NoteEvent>& notes, uint16_t ticks_per_beat) {
  std::vector<AbsoluteEvent> events;
  events.reserve(notes.size() * 2);  // 2 events per note (on + off)

  for (const auto& note : notes) {
    events.push_back({note.start(), kNoteOnRank, note.pitch(), note.velocity()});
    events.push_back({note.endTick(), kNoteOffRank, note.pitch(), 0});
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const AbsoluteEvent& a, const AbsoluteEvent& b) {
                     if (a.tick != b.tick) return a.tick < b.tick;
                     return a.rank < b.rank;
                   });

  EncodedTrack track;
  track.ticks_per_beat = ticks_per_beat;
  track.messages.reserve(events.size() + 1);

  Tick last_tick = 0;
  for (const auto& evt : events) {
    Tick delta = evt.tick - last_tick;
    last_tick = evt.tick;

    if (evt.rank == kNoteOnRank) {
      track.messages.push_back(TrackMessage::noteOn(delta, evt.pitch, evt.velocity));
    } else {
      track.messages.push_back(TrackMessage::noteOff(delta, evt.pitch));
    }
  }

  track.messages.push_back(TrackMessage::endOfTrack());
  return track;
}

}  // namespace mididiff
