/**
 * @file basic_types.h
 * @brief Fundamental types: Tick, MIDI value limits.
 */

#ifndef MIDIDIFF_CORE_BASIC_TYPES_H
#define MIDIDIFF_CORE_BASIC_TYPES_H

#include <cstdint>

namespace mididiff {

/// Time unit in ticks.
using Tick = uint32_t;

/// Default ticks per quarter note when no source resolution is known.
constexpr uint16_t kDefaultTicksPerBeat = 480;

/// Highest MIDI data byte value (note number, velocity).
constexpr uint8_t kMaxMidiDataValue = 127;

/// Highest MIDI channel index (0-based).
constexpr uint8_t kMaxMidiChannel = 15;

/// Largest value a 4-byte variable-length quantity can carry.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

}  // namespace mididiff

#endif  // MIDIDIFF_CORE_BASIC_TYPES_H
