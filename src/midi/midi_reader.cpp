/**
 * @file midi_reader.cpp
 * @brief Implementation of the Standard MIDI File parser.
 */

#include "midi/midi_reader.h"

#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include "midi/byte_order.h"

namespace mididiff {

namespace {

constexpr size_t kChunkHeaderSize = 8;
constexpr size_t kMinHeaderSize = 14;
constexpr uint8_t kMetaTrackName = 0x03;
constexpr uint8_t kMetaEndOfTrack = 0x2F;

std::string hexByte(uint8_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(value);
  return oss.str();
}

}  // namespace

bool MidiReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    midi_ = ParsedMidi{};
    error_ = "Failed to open file: " + path;
    return false;
  }

  auto size = file.tellg();
  if (size < 0) {
    midi_ = ParsedMidi{};
    error_ = "Failed to get size of file: " + path;
    return false;
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    midi_ = ParsedMidi{};
    error_ = "Failed to read file: " + path;
    return false;
  }

  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  midi_ = ParsedMidi{};
  error_.clear();

  if (data.size() < kMinHeaderSize) {
    error_ = "File too small for MIDI header";
    return false;
  }

  size_t offset = 0;
  if (!parseHeader(data.data(), data.size(), offset)) {
    return false;
  }

  // Read the declared number of MTrk chunks, skipping alien chunks.
  // Bytes after the last declared track are ignored.
  size_t track_index = 0;
  while (track_index < midi_.num_tracks) {
    if (data.size() - offset < kChunkHeaderSize) {
      error_ = "Expected " + std::to_string(midi_.num_tracks) + " tracks, found " +
               std::to_string(track_index);
      return false;
    }

    bool is_track = std::memcmp(data.data() + offset, "MTrk", 4) == 0;
    uint32_t chunk_size = readUint32BE(data.data() + offset + 4);
    offset += kChunkHeaderSize;

    if (chunk_size > data.size() - offset) {
      error_ = "Chunk data exceeds file size at offset " + std::to_string(offset);
      return false;
    }

    if (is_track) {
      if (!parseTrack(data.data() + offset, chunk_size, track_index)) {
        return false;
      }
      ++track_index;
    }

    offset += chunk_size;
  }

  return true;
}

bool MidiReader::parseHeader(const uint8_t* data, size_t size, size_t& body_offset) {
  if (std::memcmp(data, "MThd", 4) != 0) {
    error_ = "Invalid MIDI header (expected MThd)";
    return false;
  }

  uint32_t header_size = readUint32BE(data + 4);
  if (header_size < 6) {
    error_ = "Invalid header chunk size";
    return false;
  }
  if (header_size > size - kChunkHeaderSize) {
    error_ = "Header chunk exceeds file size";
    return false;
  }

  midi_.format = readUint16BE(data + 8);
  midi_.num_tracks = readUint16BE(data + 10);
  midi_.division = readUint16BE(data + 12);

  body_offset = kChunkHeaderSize + header_size;
  return true;
}

bool MidiReader::parseTrack(const uint8_t* data, size_t size, size_t track_index) {
  ParsedTrack track;
  size_t offset = 0;
  uint8_t running_status = 0;

  while (offset < size) {
    uint32_t delta = 0;
    if (!readVariableLength(data, offset, size, delta)) {
      return trackError(track_index, "truncated delta time");
    }
    if (offset >= size) {
      return trackError(track_index, "missing event after delta time");
    }

    uint8_t status = data[offset];

    // Handle running status
    if (status < 0x80) {
      if (running_status == 0) {
        return trackError(track_index, "running status used before any status byte");
      }
      status = running_status;
    } else {
      offset++;
      if (status < 0xF0) {
        running_status = status;
      }
    }

    // Channel voice messages
    if (status < 0xF0) {
      uint8_t type = status & 0xF0;
      size_t data_len = (type == 0xC0 || type == 0xD0) ? 1 : 2;
      if (data_len > size - offset) {
        return trackError(track_index, "truncated channel message");
      }
      uint8_t data1 = data[offset];
      uint8_t data2 = data_len == 2 ? data[offset + 1] : 0;
      if (data1 > kMaxMidiDataValue || data2 > kMaxMidiDataValue) {
        return trackError(track_index, "data byte out of range in " + hexByte(status) +
                                           " message");
      }
      offset += data_len;

      uint8_t channel = status & 0x0F;
      if (type == 0x90) {
        track.messages.push_back(TrackMessage::noteOn(delta, data1, data2, channel));
      } else if (type == 0x80) {
        track.messages.push_back(TrackMessage::noteOff(delta, data1, data2, channel));
      } else {
        track.messages.push_back(TrackMessage::other(delta));
      }
      continue;
    }

    if (status == 0xFF) {
      // Meta event
      if (offset >= size) {
        return trackError(track_index, "truncated meta event");
      }
      uint8_t meta_type = data[offset++];
      uint32_t meta_len = 0;
      if (!readVariableLength(data, offset, size, meta_len)) {
        return trackError(track_index, "truncated meta event length");
      }
      if (meta_len > size - offset) {
        return trackError(track_index, "meta event exceeds track data");
      }

      if (meta_type == kMetaTrackName) {
        track.name = std::string(reinterpret_cast<const char*>(data + offset), meta_len);
      }
      offset += meta_len;

      if (meta_type == kMetaEndOfTrack) {
        track.messages.push_back(TrackMessage::endOfTrack(delta));
        break;
      }
      track.messages.push_back(TrackMessage::other(delta));
      continue;
    }

    if (status == 0xF0 || status == 0xF7) {
      // SysEx
      uint32_t sysex_len = 0;
      if (!readVariableLength(data, offset, size, sysex_len)) {
        return trackError(track_index, "truncated SysEx length");
      }
      if (sysex_len > size - offset) {
        return trackError(track_index, "SysEx exceeds track data");
      }
      offset += sysex_len;
      track.messages.push_back(TrackMessage::other(delta));
      continue;
    }

    return trackError(track_index, "unsupported status byte " + hexByte(status));
  }

  midi_.tracks.push_back(std::move(track));
  return true;
}

bool MidiReader::trackError(size_t track_index, const std::string& message) {
  error_ = "Track " + std::to_string(track_index) + ": " + message;
  return false;
}

}  // namespace mididiff
