/**
 * @file midi_diff.cpp
 * @brief Command-line front end for MidiDiff.
 *
 * Usage:
 *   midi_diff diff a.mid b.mid out.mid   # Write notes present in only one input
 *   midi_diff a.mid b.mid out.mid        # Same ('diff' is implied)
 *   midi_diff debug-info                 # Version and environment details
 *   midi_diff --version
 */

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "mididiff.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage(std::ostream& os, const char* prog) {
  os << "Usage: " << prog << " [diff] <file_a> <file_b> <out_file> [options]\n"
     << "       " << prog << " debug-info\n"
     << "       " << prog << " --version\n"
     << "\n"
     << "Compare two MIDI files and write the notes found in only one of them.\n"
     << "An existing <out_file> is never overwritten; _1, _2, ... is appended.\n"
     << "\n"
     << "Options:\n"
     << "  -q, --quiet         Only report errors\n"
     << "  --report-dropped    Show note pairings dropped while reading each input\n"
     << "  -V, --version       Show version\n"
     << "  -h, --help          Show this help\n";
}

const char* platformName() {
#if defined(__linux__)
  return "Linux";
#elif defined(__APPLE__)
  return "macOS";
#elif defined(_WIN32)
  return "Windows";
#else
  return "unknown";
#endif
}

const char* compilerName() {
#if defined(__clang__)
  return "clang " __clang_version__;
#elif defined(__GNUC__)
  return "gcc " __VERSION__;
#elif defined(_MSC_VER)
  return "msvc";
#else
  return "unknown";
#endif
}

void printVersion() {
  std::cout << "midi_diff " << mididiff::MidiDiff::version() << "\n";
}

void printDebugInfo() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);

  std::cout << "MidiDiff Debug Information\n"
            << "========================================\n"
            << "MidiDiff: " << mididiff::MidiDiff::version() << "\n"
            << "Compiler: " << compilerName() << "\n"
            << "C++ standard: " << __cplusplus << "\n"
            << "Platform: " << platformName() << "\n"
            << "Working Directory: " << (ec ? std::string("unavailable") : cwd.string())
            << "\n";
}

int runDiff(const char* prog, const std::vector<std::string>& args) {
  mididiff::DiffConfig config;
  std::vector<std::string> positional;

  for (const auto& arg : args) {
    if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
    } else if (arg == "--report-dropped") {
      config.report_dropped = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage(std::cout, prog);
      return kExitOk;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(std::cerr, prog);
      return kExitUsage;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 3) {
    std::cerr << "Expected 3 paths (file_a file_b out_file), got " << positional.size() << "\n";
    printUsage(std::cerr, prog);
    return kExitUsage;
  }

  config.file_a = positional[0];
  config.file_b = positional[1];
  config.output_path = positional[2];

  mididiff::MidiDiff differ;
  return differ.run(config) == mididiff::DiffStatus::Ok ? kExitOk : kExitFailure;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(std::cerr, argv[0]);
    return kExitUsage;
  }

  if (std::strcmp(argv[1], "-V") == 0 || std::strcmp(argv[1], "--version") == 0) {
    printVersion();
    return kExitOk;
  }
  if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
    printUsage(std::cout, argv[0]);
    return kExitOk;
  }
  if (std::strcmp(argv[1], "debug-info") == 0) {
    printDebugInfo();
    return kExitOk;
  }

  // Anything that is not a known subcommand is taken as the first path of
  // an implicit 'diff'
  int first = std::strcmp(argv[1], "diff") == 0 ? 2 : 1;
  std::vector<std::string> args(argv + first, argv + argc);
  return runDiff(argv[0], args);
}
