/**
 * @file note_extractor.cpp
 * @brief Implementation of note-on/note-off pairing.
 */

#include "diff/note_extractor.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

namespace mididiff {

namespace {

// Sounding note awaiting its note-off
struct OpenNote {
  uint64_t start_tick;
  uint8_t velocity;
};

// Appends one track's notes to out. Ticks are 64-bit so long tracks cannot
// wrap; NoteEvent::create rejects anything past the Tick range.
void extractTrack(const ParsedTrack& track, std::vector<NoteEvent>& out,
                  ExtractionStats& stats) {
  std::array<std::vector<OpenNote>, kMaxMidiDataValue + 1> open_notes;
  uint64_t tick = 0;

  for (const auto& msg : track.messages) {
    tick += msg.delta;

    bool is_note_on = msg.type == MessageType::NoteOn && msg.velocity > 0;
    bool is_note_off = msg.type == MessageType::NoteOff ||
                       (msg.type == MessageType::NoteOn && msg.velocity == 0);

    if (is_note_on) {
      open_notes[msg.note & 0x7F].push_back({tick, msg.velocity});
    } else if (is_note_off) {
      auto& stack = open_notes[msg.note & 0x7F];
      if (stack.empty()) {
        stats.unmatched_note_offs++;
        continue;
      }
      OpenNote open = stack.back();
      stack.pop_back();

      if (tick <= open.start_tick) {
        stats.non_positive_durations++;
        continue;
      }
      auto note = NoteEvent::create(msg.note, static_cast<int64_t>(open.start_tick),
                                    static_cast<int64_t>(tick - open.start_tick),
                                    open.velocity);
      if (!note) {
        stats.rejected_notes++;
        continue;
      }
      out.push_back(*note);
    }
  }

  for (const auto& stack : open_notes) {
    stats.unclosed_note_ons += stack.size();
  }
}

}  // namespace

std::vector<NoteEvent> extractNotes(const std::vector<ParsedTrack>& tracks,
                                    ExtractionStats* stats) {
  ExtractionStats local_stats;
  std::vector<NoteEvent> notes;

  for (const auto& track : tracks) {
    extractTrack(track, notes, local_stats);
  }

  std::stable_sort(notes.begin(), notes.end(), [](const NoteEvent& a, const NoteEvent& b) {
    return a.start() < b.start();
  });

  if (stats) *stats = local_stats;
  return notes;
}

std::vector<NoteEvent> extractNotes(const ParsedMidi& midi, ExtractionStats* stats) {
  return extractNotes(midi.tracks, stats);
}

}  // namespace mididiff
