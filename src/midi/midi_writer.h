#ifndef MIDIDIFF_MIDI_WRITER_H
#define MIDIDIFF_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "midi/track_message.h"

namespace mididiff {

// Writes a single-track SMF Type 1 file from a delta-time message stream.
// This class is intentionally "dumb" - it only handles byte-level output.
class MidiWriter {
 public:
  MidiWriter() = default;

  // Builds MIDI data from one track's messages.
  // @param division Ticks per quarter note written to the header
  // @param messages Ordered messages; an end-of-track is appended if missing
  // @returns false if a value cannot be encoded (see getError())
  bool build(uint16_t division, const std::vector<TrackMessage>& messages);

  // Returns the MIDI data as a byte vector.
  // @returns MIDI binary data (empty until build() succeeds)
  const std::vector<uint8_t>& toBytes() const { return data_; }

  // Writes MIDI data to a file.
  // @param path Output file path
  // @returns true on success, false on failure
  bool writeToFile(const std::string& path);

  const std::string& getError() const { return error_; }

 private:
  std::vector<uint8_t> data_;
  std::string error_;

  // Writes the MIDI file header chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  // Encodes the track body and appends the MTrk chunk.
  bool writeTrack(const std::vector<TrackMessage>& messages);
};

}  // namespace mididiff

#endif  // MIDIDIFF_MIDI_WRITER_H
