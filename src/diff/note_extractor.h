/**
 * @file note_extractor.h
 * @brief Pairs note-on/note-off messages into NoteEvents.
 */

#ifndef MIDIDIFF_DIFF_NOTE_EXTRACTOR_H
#define MIDIDIFF_DIFF_NOTE_EXTRACTOR_H

#include <cstddef>
#include <vector>

#include "core/note_event.h"
#include "midi/track_message.h"

namespace mididiff {

/// @brief Counts of pairings the extractor dropped.
///
/// Dropping is the normal lenient behavior for non-conformant files; these
/// counters only report it.
struct ExtractionStats {
  size_t unmatched_note_offs = 0;     ///< Note-off with no open note of that pitch
  size_t unclosed_note_ons = 0;       ///< Note-on still open at end of track
  size_t non_positive_durations = 0;  ///< Off at the same tick as its on
  size_t rejected_notes = 0;          ///< Pairing outside NoteEvent's value range

  size_t totalDropped() const {
    return unmatched_note_offs + unclosed_note_ons + non_positive_durations + rejected_notes;
  }
};

/**
 * @brief Extract notes from every track of a decoded file.
 *
 * Each track is scanned with its own tick counter starting at zero. Open
 * notes are kept per pitch on a stack, so a note-off closes the most
 * recently opened instance of its pitch. A note-on with velocity 0 counts
 * as a note-off. Unmatched or zero-length pairings are dropped silently.
 *
 * @param tracks Tracks in file order
 * @param stats Optional output for dropped-pairing counts
 * @return Notes from all tracks, stable-sorted by start tick
 */
std::vector<NoteEvent> extractNotes(const std::vector<ParsedTrack>& tracks,
                                    ExtractionStats* stats = nullptr);

/// @brief Convenience overload for a whole ParsedMidi.
std::vector<NoteEvent> extractNotes(const ParsedMidi& midi, ExtractionStats* stats = nullptr);

}  // namespace mididiff

#endif  // MIDIDIFF_DIFF_NOTE_EXTRACTOR_H
