/**
 * @file note_encoder.h
 * @brief Converts NoteEvents back into a delta-time message stream.
 */

#ifndef MIDIDIFF_DIFF_NOTE_ENCODER_H
#define MIDIDIFF_DIFF_NOTE_ENCODER_H

#include <cstdint>
#include <vector>

#include "core/note_event.h"
#include "midi/track_message.h"

namespace mididiff {

/// @brief Single output track ready for MidiWriter.
struct EncodedTrack {
  uint16_t ticks_per_beat = kDefaultTicksPerBeat;
  std::vector<TrackMessage> messages;  ///< Ends with an end-of-track message
};

/**
 * @brief Encode notes as one track of note-on/note-off messages.
 *
 * Each note becomes a note-on at its start and a note-off (velocity 0) at
 * start + duration, all on channel 0. Events are ordered by absolute tick;
 * at equal ticks note-offs come before note-ons, so a note ending where
 * another of the same pitch begins is closed first. Deltas are never
 * negative. An end-of-track message with delta 0 terminates the stream.
 *
 * @param notes Notes in any order
 * @param ticks_per_beat Resolution passed through to the writer
 * @return Encoded track
 */
EncodedTrack encodeNotes(const std::vector<NoteEvent>& notes, uint16_t ticks_per_beat);

}  // namespace mididiff

#endif  // MIDIDIFF_DIFF_NOTE_ENCODER_H
