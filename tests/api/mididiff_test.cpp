/**
 * @file mididiff_test.cpp
 * @brief End-to-end tests for the MidiDiff pipeline.
 */

#include "mididiff.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "diff/note_encoder.h"
#include "midi/midi_reader.h"
#include "midi/midi_writer.h"
#include "test_helpers/note_event_test_helper.h"

namespace mididiff {
namespace {

namespace fs = std::filesystem;
using test::makeNote;

class MidiDiffTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::path(::testing::TempDir()) / (std::string("mididiff_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string path(const std::string& name) const { return (dir_ / name).string(); }

  void writeNotes(const std::string& file, const std::vector<NoteEvent>& notes,
                  uint16_t division = 480) {
    EncodedTrack track = encodeNotes(notes, division);
    MidiWriter writer;
    ASSERT_TRUE(writer.build(track.ticks_per_beat, track.messages)) << writer.getError();
    ASSERT_TRUE(writer.writeToFile(file)) << writer.getError();
  }

  void touch(const std::string& file) {
    std::ofstream stream(file);
    stream << "x";
  }

  DiffConfig config(const std::string& out_name) const {
    DiffConfig cfg;
    cfg.file_a = path("a.mid");
    cfg.file_b = path("b.mid");
    cfg.output_path = path(out_name);
    return cfg;
  }

  fs::path dir_;
  std::ostringstream out_;
  std::ostringstream err_;
};

// ============================================================================
// Pipeline
// ============================================================================

TEST_F(MidiDiffTest, SingleNoteOnlyInA) {
  writeNotes(path("a.mid"), {makeNote(60, 0, 10, 100)}, 96);
  writeNotes(path("b.mid"), {});

  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(config("diff.mid")), DiffStatus::Ok) << err_.str();

  const DiffSummary& summary = differ.lastSummary();
  EXPECT_EQ(summary.only_in_a, 1u);
  EXPECT_EQ(summary.only_in_b, 0u);
  EXPECT_EQ(summary.output_path, path("diff.mid"));
  EXPECT_NE(out_.str().find("Notes only in A: 1"), std::string::npos);
  EXPECT_NE(out_.str().find("Notes only in B: 0"), std::string::npos);
  EXPECT_NE(out_.str().find("Saved diff MIDI -> "), std::string::npos);
  EXPECT_TRUE(err_.str().empty());

  MidiReader reader;
  ASSERT_TRUE(reader.read(summary.output_path)) << reader.getError();
  const auto& parsed = reader.getParsedMidi();
  EXPECT_EQ(parsed.division, 96);  // resolution taken from file A
  ASSERT_EQ(parsed.tracks.size(), 1u);
  const auto& msgs = parsed.tracks[0].messages;
  ASSERT_EQ(msgs.size(), 3u);
  EXPECT_EQ(msgs[0].type, MessageType::NoteOn);
  EXPECT_EQ(msgs[0].delta, 0u);
  EXPECT_EQ(msgs[0].velocity, 100);
  EXPECT_EQ(msgs[1].type, MessageType::NoteOff);
  EXPECT_EQ(msgs[1].delta, 10u);
  EXPECT_EQ(msgs[2].type, MessageType::EndOfTrack);
  EXPECT_EQ(msgs[2].delta, 0u);
}

TEST_F(MidiDiffTest, IdenticalFilesGiveEmptyTrack) {
  std::vector<NoteEvent> notes = {makeNote(60, 0, 240), makeNote(64, 240, 240)};
  writeNotes(path("a.mid"), notes);
  writeNotes(path("b.mid"), notes);

  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(config("diff.mid")), DiffStatus::Ok);
  EXPECT_EQ(differ.lastSummary().only_in_a, 0u);
  EXPECT_EQ(differ.lastSummary().only_in_b, 0u);

  MidiReader reader;
  ASSERT_TRUE(reader.read(differ.lastSummary().output_path));
  ASSERT_EQ(reader.getParsedMidi().tracks.size(), 1u);
  EXPECT_EQ(reader.getParsedMidi().tracks[0].messages.size(), 1u);
}

TEST_F(MidiDiffTest, BothSidesContribute) {
  writeNotes(path("a.mid"), {makeNote(60, 0, 100), makeNote(62, 100, 100)});
  writeNotes(path("b.mid"), {makeNote(60, 0, 100), makeNote(65, 50, 100), makeNote(67, 0, 20)});

  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(config("diff.mid")), DiffStatus::Ok);
  EXPECT_EQ(differ.lastSummary().notes_in_a, 2u);
  EXPECT_EQ(differ.lastSummary().notes_in_b, 3u);
  EXPECT_EQ(differ.lastSummary().only_in_a, 1u);
  EXPECT_EQ(differ.lastSummary().only_in_b, 2u);
}

TEST_F(MidiDiffTest, QuietSuppressesInfo) {
  writeNotes(path("a.mid"), {makeNote(60, 0, 10)});
  writeNotes(path("b.mid"), {});

  DiffConfig cfg = config("diff.mid");
  cfg.quiet = true;
  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(cfg), DiffStatus::Ok);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(MidiDiffTest, ReportDropped) {
  // Hand-built track: an unmatched note-off and an unclosed note-on
  std::vector<TrackMessage> messages = {TrackMessage::noteOff(0, 50),
                                        TrackMessage::noteOn(0, 60, 100)};
  MidiWriter writer;
  ASSERT_TRUE(writer.build(480, messages));
  ASSERT_TRUE(writer.writeToFile(path("a.mid")));
  writeNotes(path("b.mid"), {});

  DiffConfig cfg = config("diff.mid");
  cfg.report_dropped = true;
  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(cfg), DiffStatus::Ok);
  EXPECT_EQ(differ.lastSummary().dropped_a.unmatched_note_offs, 1u);
  EXPECT_EQ(differ.lastSummary().dropped_a.unclosed_note_ons, 1u);
  EXPECT_NE(out_.str().find("Dropped in " + path("a.mid") + ": 2"), std::string::npos);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(MidiDiffTest, MissingInputsReportedBeforeDecode) {
  MidiDiff differ(out_, err_);
  EXPECT_EQ(differ.run(config("diff.mid")), DiffStatus::InputMissing);
  EXPECT_NE(err_.str().find("Input file not found: " + path("a.mid")), std::string::npos);
  EXPECT_NE(err_.str().find("Input file not found: " + path("b.mid")), std::string::npos);
  EXPECT_FALSE(fs::exists(path("diff.mid")));
}

TEST_F(MidiDiffTest, DecodeFailure) {
  touch(path("a.mid"));
  writeNotes(path("b.mid"), {});

  MidiDiff differ(out_, err_);
  EXPECT_EQ(differ.run(config("diff.mid")), DiffStatus::DecodeFailed);
  EXPECT_NE(err_.str().find("Failed to read " + path("a.mid")), std::string::npos);
  EXPECT_FALSE(fs::exists(path("diff.mid")));
}

TEST_F(MidiDiffTest, WriteFailureWhenParentIsFile) {
  writeNotes(path("a.mid"), {makeNote(60, 0, 10)});
  writeNotes(path("b.mid"), {});
  // Parent "blocker" is a regular file, so the output cannot be created
  touch(path("blocker"));

  DiffConfig cfg = config("blocker/diff.mid");
  MidiDiff differ(out_, err_);
  EXPECT_EQ(differ.run(cfg), DiffStatus::WriteFailed);
  EXPECT_NE(err_.str().find("Failed to write"), std::string::npos);
  EXPECT_TRUE(differ.lastSummary().output_path.empty());
}

// ============================================================================
// Output Path Resolution
// ============================================================================

TEST_F(MidiDiffTest, ResolveUnusedPathUnchanged) {
  EXPECT_EQ(MidiDiff::resolveOutputPath(path("out.mid")), path("out.mid"));
}

TEST_F(MidiDiffTest, ResolveAppendsCounter) {
  touch(path("out.mid"));
  EXPECT_EQ(MidiDiff::resolveOutputPath(path("out.mid")), path("out_1.mid"));

  touch(path("out_1.mid"));
  EXPECT_EQ(MidiDiff::resolveOutputPath(path("out.mid")), path("out_2.mid"));
}

TEST_F(MidiDiffTest, ResolveUsesDefaultExtension) {
  touch(path("out"));
  EXPECT_EQ(MidiDiff::resolveOutputPath(path("out")), path("out_1.mid"));
}

TEST_F(MidiDiffTest, ResolveCreatesParentDirectory) {
  std::string requested = path("nested/deeper/out.mid");
  EXPECT_EQ(MidiDiff::resolveOutputPath(requested), requested);
  EXPECT_TRUE(fs::is_directory(path("nested/deeper")));
}

TEST_F(MidiDiffTest, RunNeverOverwrites) {
  writeNotes(path("a.mid"), {makeNote(60, 0, 10)});
  writeNotes(path("b.mid"), {});
  touch(path("diff.mid"));

  MidiDiff differ(out_, err_);
  ASSERT_EQ(differ.run(config("diff.mid")), DiffStatus::Ok);
  EXPECT_EQ(differ.lastSummary().output_path, path("diff_1.mid"));
  EXPECT_EQ(fs::file_size(path("diff.mid")), 1u);
}

TEST(MidiDiffVersionTest, VersionNotEmpty) {
  EXPECT_STRNE(MidiDiff::version(), "");
  EXPECT_STREQ(diffStatusToString(DiffStatus::InputMissing), "input_missing");
}

}  // namespace
}  // namespace mididiff
