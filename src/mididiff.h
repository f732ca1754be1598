/**
 * @file mididiff.h
 * @brief High-level API: diff two MIDI files into a third.
 */

#ifndef MIDIDIFF_H
#define MIDIDIFF_H

#include <cstddef>
#include <iostream>
#include <string>

#include "core/diff_config.h"
#include "diff/note_extractor.h"

namespace mididiff {

/// @brief Counts and paths from the most recent run().
struct DiffSummary {
  size_t notes_in_a = 0;
  size_t notes_in_b = 0;
  size_t only_in_a = 0;
  size_t only_in_b = 0;
  ExtractionStats dropped_a;
  ExtractionStats dropped_b;
  std::string output_path;  ///< Path actually written (empty unless Ok)
};

/// @brief Sequences load -> extract -> diff -> encode -> save.
///
/// All failures are reported on the error stream and returned as a
/// DiffStatus; nothing is thrown.
class MidiDiff {
 public:
  /**
   * @param out Stream for informational messages
   * @param err Stream for error messages
   */
  explicit MidiDiff(std::ostream& out = std::cout, std::ostream& err = std::cerr);

  /**
   * @brief Diff config.file_a against config.file_b and save the result.
   * @param config Run parameters
   * @return Ok, or the stage that failed
   */
  DiffStatus run(const DiffConfig& config);

  /// @brief Summary of the last run() (partially filled on failure).
  const DiffSummary& lastSummary() const { return summary_; }

  /**
   * @brief Pick a path that does not overwrite an existing file.
   *
   * Creates the parent directory if missing (errors ignored). Returns the
   * path unchanged when it does not exist; otherwise probes
   * `<stem>_1<ext>`, `<stem>_2<ext>`, ... using `.mid` when the request
   * has no extension.
   *
   * @param requested Requested output path
   * @return First unused candidate
   */
  static std::string resolveOutputPath(const std::string& requested);

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "1.0.0")
   */
  static const char* version();

 private:
  std::ostream& out_;
  std::ostream& err_;
  bool quiet_ = false;
  DiffSummary summary_;

  void reportDropped(const std::string& path, const ExtractionStats& stats);
};

}  // namespace mididiff

#endif  // MIDIDIFF_H
