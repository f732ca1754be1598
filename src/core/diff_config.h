/**
 * @file diff_config.h
 * @brief Parameters for one diff run.
 */

#ifndef MIDIDIFF_CORE_DIFF_CONFIG_H
#define MIDIDIFF_CORE_DIFF_CONFIG_H

#include <string>

namespace mididiff {

/// @brief Inputs and reporting switches for MidiDiff::run().
struct DiffConfig {
  std::string file_a;       ///< First MIDI file (its resolution is used for output)
  std::string file_b;       ///< Second MIDI file
  std::string output_path;  ///< Requested output; never overwritten (see resolveOutputPath)
  bool quiet = false;           ///< Suppress informational output (errors still reported)
  bool report_dropped = false;  ///< Print dropped-pairing counts per input
};

/// @brief Outcome of MidiDiff::run().
enum class DiffStatus {
  Ok,            ///< Diff written
  InputMissing,  ///< An input path does not exist; nothing decoded
  DecodeFailed,  ///< An input could not be parsed
  WriteFailed    ///< The result could not be encoded or written
};

/// @brief Short name for a status, e.g. "input_missing".
inline const char* diffStatusToString(DiffStatus status) {
  switch (status) {
    case DiffStatus::Ok: return "ok";
    case DiffStatus::InputMissing: return "input_missing";
    case DiffStatus::DecodeFailed: return "decode_failed";
    case DiffStatus::WriteFailed: return "write_failed";
  }
  return "unknown";
}

}  // namespace mididiff

#endif  // MIDIDIFF_CORE_DIFF_CONFIG_H
