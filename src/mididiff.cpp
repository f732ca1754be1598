/**
 * @file mididiff.cpp
 * @brief Implementation of the diff pipeline.
 */

#include "mididiff.h"

#include <filesystem>
#include <system_error>

#include "diff/note_differ.h"
#include "diff/note_encoder.h"
#include "midi/midi_reader.h"
#include "midi/midi_writer.h"

namespace mididiff {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultExtension = ".mid";

bool pathExists(const std::string& path) {
  std::error_code ec;
  return fs::exists(fs::path(path), ec);
}

}  // namespace

MidiDiff::MidiDiff(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

DiffStatus MidiDiff::run(const DiffConfig& config) {
  summary_ = DiffSummary{};
  quiet_ = config.quiet;

  // Report every missing input before giving up
  bool missing = false;
  for (const std::string* path : {&config.file_a, &config.file_b}) {
    if (!pathExists(*path)) {
      err_ << "Input file not found: " << *path << "\n";
      missing = true;
    }
  }
  if (missing) return DiffStatus::InputMissing;

  MidiReader reader_a;
  if (!reader_a.read(config.file_a)) {
    err_ << "Failed to read " << config.file_a << ": " << reader_a.getError() << "\n";
    return DiffStatus::DecodeFailed;
  }
  MidiReader reader_b;
  if (!reader_b.read(config.file_b)) {
    err_ << "Failed to read " << config.file_b << ": " << reader_b.getError() << "\n";
    return DiffStatus::DecodeFailed;
  }

  std::vector<NoteEvent> notes_a = extractNotes(reader_a.getParsedMidi(), &summary_.dropped_a);
  std::vector<NoteEvent> notes_b = extractNotes(reader_b.getParsedMidi(), &summary_.dropped_b);
  summary_.notes_in_a = notes_a.size();
  summary_.notes_in_b = notes_b.size();

  if (config.report_dropped) {
    reportDropped(config.file_a, summary_.dropped_a);
    reportDropped(config.file_b, summary_.dropped_b);
  }

  DiffResult diff = diffNotes(notes_a, notes_b);
  summary_.only_in_a = diff.only_in_a;
  summary_.only_in_b = diff.only_in_b;

  if (!quiet_) {
    out_ << "Notes only in A: " << diff.only_in_a << "\n";
    out_ << "Notes only in B: " << diff.only_in_b << "\n";
  }

  EncodedTrack track = encodeNotes(diff.notes, reader_a.getParsedMidi().division);

  std::string output_path = resolveOutputPath(config.output_path);

  MidiWriter writer;
  if (!writer.build(track.ticks_per_beat, track.messages) || !writer.writeToFile(output_path)) {
    err_ << "Failed to write " << output_path << ": " << writer.getError() << "\n";
    return DiffStatus::WriteFailed;
  }

  summary_.output_path = output_path;
  if (!quiet_) {
    out_ << "Saved diff MIDI -> " << output_path << "\n";
  }
  return DiffStatus::Ok;
}

std::string MidiDiff::resolveOutputPath(const std::string& requested) {
  fs::path path(requested);

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);  // failure surfaces at write time
  }

  if (!pathExists(requested)) return requested;

  std::string extension = path.extension().string();
  if (extension.empty()) extension = kDefaultExtension;
  fs::path base = path.parent_path() / path.stem();

  for (unsigned counter = 1;; ++counter) {
    fs::path candidate = base;
    candidate += "_" + std::to_string(counter) + extension;
    if (!pathExists(candidate.string())) return candidate.string();
  }
}

void MidiDiff::reportDropped(const std::string& path, const ExtractionStats& stats) {
  if (quiet_) return;
  out_ << "Dropped in " << path << ": " << stats.totalDropped() << " (unmatched note-off "
       << stats.unmatched_note_offs << ", unclosed note-on " << stats.unclosed_note_ons
       << ", zero length " << stats.non_positive_durations << ", out of range "
       << stats.rejected_notes << ")\n";
}

const char* MidiDiff::version() {
  return "1.0.0";
}

}  // namespace mididiff
