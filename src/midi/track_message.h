/**
 * @file track_message.h
 * @brief Delta-time message model shared by the reader, writer and diff engine.
 */

#ifndef MIDIDIFF_MIDI_TRACK_MESSAGE_H
#define MIDIDIFF_MIDI_TRACK_MESSAGE_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace mididiff {

/// @brief Message kinds the diff engine distinguishes.
enum class MessageType : uint8_t {
  NoteOn,      ///< 0x9n (velocity 0 is kept as NoteOn; see Extractor)
  NoteOff,     ///< 0x8n
  EndOfTrack,  ///< Meta 0x2F
  Other        ///< Anything else (CC, program change, meta, SysEx...)
};

/// @brief One track message with its relative time.
struct TrackMessage {
  Tick delta = 0;                       ///< Ticks since the previous message in the track
  MessageType type = MessageType::Other;
  uint8_t channel = 0;                  ///< 0-15 (note messages only)
  uint8_t note = 0;                     ///< 0-127 (note messages only)
  uint8_t velocity = 0;                 ///< 0-127 (note messages only)

  static TrackMessage noteOn(Tick delta, uint8_t note, uint8_t velocity, uint8_t channel = 0) {
    return {delta, MessageType::NoteOn, channel, note, velocity};
  }
  static TrackMessage noteOff(Tick delta, uint8_t note, uint8_t velocity = 0,
                              uint8_t channel = 0) {
    return {delta, MessageType::NoteOff, channel, note, velocity};
  }
  static TrackMessage endOfTrack(Tick delta = 0) {
    return {delta, MessageType::EndOfTrack, 0, 0, 0};
  }
  static TrackMessage other(Tick delta) { return {delta, MessageType::Other, 0, 0, 0}; }
};

/// @brief Decoded track: name (meta 0x03, if any) and its messages in order.
struct ParsedTrack {
  std::string name;
  std::vector<TrackMessage> messages;
};

/// @brief Decoded Standard MIDI File.
struct ParsedMidi {
  uint16_t format = 1;
  uint16_t num_tracks = 0;  ///< As declared in the header
  uint16_t division = kDefaultTicksPerBeat;  ///< Raw division, used as ticks per beat
  std::vector<ParsedTrack> tracks;
};

}  // namespace mididiff

#endif  // MIDIDIFF_MIDI_TRACK_MESSAGE_H
