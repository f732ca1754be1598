/**
 * @file midi_reader.h
 * @brief Standard MIDI File parser producing per-track delta-time messages.
 */

#ifndef MIDIDIFF_MIDI_MIDI_READER_H
#define MIDIDIFF_MIDI_MIDI_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "midi/track_message.h"

namespace mididiff {

/// @brief Parses SMF type 0/1/2 data into ParsedMidi.
///
/// Messages keep their relative delta times and track order; note-on with
/// velocity 0 is reported as-is. On failure read() returns false and
/// getError() describes the problem.
class MidiReader {
 public:
  MidiReader() = default;

  /// @brief Read and parse a file.
  /// @param path Input file path
  /// @returns true on success
  bool read(const std::string& path);

  /// @brief Parse an in-memory SMF image.
  /// @param data Raw file bytes
  /// @returns true on success
  bool read(const std::vector<uint8_t>& data);

  const ParsedMidi& getParsedMidi() const { return midi_; }
  const std::string& getError() const { return error_; }

 private:
  ParsedMidi midi_;
  std::string error_;

  // Parses MThd; sets body_offset to the first byte after the header chunk.
  bool parseHeader(const uint8_t* data, size_t size, size_t& body_offset);

  // Parses one MTrk payload and appends it to midi_.tracks.
  bool parseTrack(const uint8_t* data, size_t size, size_t track_index);

  bool trackError(size_t track_index, const std::string& message);
};

}  // namespace mididiff

#endif  // MIDIDIFF_MIDI_MIDI_READER_H
