/**
 * @file note_differ.cpp
 * @brief Implementation of the note set difference.
 */

#include "diff/note_differ.h"

#include <unordered_set>
#include <utility>

namespace mididiff {

namespace {

using NoteSet = std::unordered_set<NoteEvent, NoteEventHash>;

// Distinct notes of `notes` that are not in `exclude`, keeping first-seen order.
std::vector<NoteEvent> setDifference(const std::vector<NoteEvent>& notes, const NoteSet& exclude) {
  std::vector<NoteEvent> result;
  NoteSet seen;
  for (const auto& note : notes) {
    if (exclude.count(note) > 0) continue;
    if (!seen.insert(note).second) continue;
    result.push_back(note);
  }
  return result;
}

}  // namespace

DiffResult diffNotes(const std::vector<NoteEvent>& notes_a, const std::vector<NoteEvent>& notes_b) {
  const NoteSet set_a(notes_a.begin(), notes_a.end());
  const NoteSet set_b(notes_b.begin(), notes_b.end());

  std::vector<NoteEvent> only_in_a = setDifference(notes_a, set_b);
  std::vector<NoteEvent> only_in_b = setDifference(notes_b, set_a);

  DiffResult result;
  result.only_in_a = only_in_a.size();
  result.only_in_b = only_in_b.size();
  result.notes = std::move(only_in_a);
  result.notes.insert(result.notes.end(), only_in_b.begin(), only_in_b.end());
  return result;
}

}  // namespace mididiff
