/**
 * @file note_differ.h
 * @brief Symmetric difference of two note collections.
 */

#ifndef MIDIDIFF_DIFF_NOTE_DIFFER_H
#define MIDIDIFF_DIFF_NOTE_DIFFER_H

#include <cstddef>
#include <vector>

#include "core/note_event.h"

namespace mididiff {

/// @brief Result of diffNotes().
struct DiffResult {
  std::vector<NoteEvent> notes;  ///< Notes only in A, then notes only in B
  size_t only_in_a = 0;
  size_t only_in_b = 0;
};

/**
 * @brief Compute the notes present in exactly one of two collections.
 *
 * Both inputs are treated as sets keyed by (pitch, start, duration), so
 * duplicates within one input collapse to one note. When duplicates differ
 * in velocity the first instance in input order is kept.
 *
 * @param notes_a First collection
 * @param notes_b Second collection
 * @return A - B in A's order followed by B - A in B's order, with both counts
 */
DiffResult diffNotes(const std::vector<NoteEvent>& notes_a, const std::vector<NoteEvent>& notes_b);

}  // namespace mididiff

#endif  // MIDIDIFF_DIFF_NOTE_DIFFER_H
