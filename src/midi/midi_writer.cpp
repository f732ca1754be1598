/**
 * @file midi_writer.cpp
 * @brief Implementation of the single-track SMF Type 1 writer.
 */

#include "midi/midi_writer.h"

#include <algorithm>
#include <cstdint>
#include <fstream>

#include "midi/byte_order.h"

namespace mididiff {

bool MidiWriter::build(uint16_t division, const std::vector<TrackMessage>& messages) {
  data_.clear();
  error_.clear();

  if (division == 0) {
    error_ = "Division (ticks per beat) must be positive";
    return false;
  }
  // Bit 15 selects SMPTE timing, which this writer does not produce
  if (division & 0x8000) {
    error_ = "SMPTE division is not supported: " + std::to_string(division);
    return false;
  }

  writeHeader(1, division);
  if (!writeTrack(messages)) {
    data_.clear();
    return false;
  }
  return true;
}

bool MidiWriter::writeToFile(const std::string& path) {
  if (data_.empty()) {
    error_ = "Nothing to write (build() not called or failed)";
    return false;
  }

  std::ofstream file(path, std::ios::binary);
  if (!file) {
    error_ = "Failed to open file for writing: " + path;
    return false;
  }

  file.write(reinterpret_cast<const char*>(data_.data()),
             static_cast<std::streamsize>(data_.size()));
  if (!file) {
    error_ = "Failed to write file: " + path;
    return false;
  }
  return true;
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  // MThd
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('h');
  data_.push_back('d');

  // Header length = 6
  writeUint32BE(data_, 6);

  // Format = 1
  writeUint16BE(data_, 1);

  writeUint16BE(data_, num_tracks);

  // Division (ticks per quarter note)
  writeUint16BE(data_, division);
}

bool MidiWriter::writeTrack(const std::vector<TrackMessage>& messages) {
  std::vector<uint8_t> track_data;
  track_data.reserve(messages.size() * 4 + 4);

  // Delta of skipped (Other) messages is carried into the next written event
  uint64_t pending_delta = 0;
  bool has_end_of_track = false;

  for (size_t i = 0; i < messages.size(); ++i) {
    const TrackMessage& msg = messages[i];
    pending_delta += msg.delta;

    if (msg.type == MessageType::Other) continue;

    if (pending_delta > kMaxVariableLength) {
      error_ = "Delta time too large at message " + std::to_string(i) + ": " +
               std::to_string(pending_delta);
      return false;
    }
    writeVariableLength(track_data, static_cast<uint32_t>(pending_delta));
    pending_delta = 0;

    if (msg.type == MessageType::EndOfTrack) {
      track_data.push_back(0xFF);
      track_data.push_back(0x2F);
      track_data.push_back(0x00);
      has_end_of_track = true;
      break;
    }

    if (msg.note > kMaxMidiDataValue || msg.velocity > kMaxMidiDataValue ||
        msg.channel > kMaxMidiChannel) {
      error_ = "Note message out of range at message " + std::to_string(i);
      return false;
    }

    uint8_t status = msg.type == MessageType::NoteOn ? 0x90 : 0x80;
    track_data.push_back(status | msg.channel);
    track_data.push_back(msg.note);
    track_data.push_back(msg.velocity);
  }

  if (!has_end_of_track) {
    if (!writeVariableLength(track_data, static_cast<uint32_t>(
                                             std::min<uint64_t>(pending_delta, UINT32_MAX)))) {
      error_ = "Delta time too large before end of track: " + std::to_string(pending_delta);
      return false;
    }
    track_data.push_back(0xFF);
    track_data.push_back(0x2F);
    track_data.push_back(0x00);
  }

  // Write track header
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('r');
  data_.push_back('k');
  writeUint32BE(data_, static_cast<uint32_t>(track_data.size()));

  data_.insert(data_.end(), track_data.begin(), track_data.end());
  return true;
}

}  // namespace mididiff
