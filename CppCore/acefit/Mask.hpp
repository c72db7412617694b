#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Atom and force masks of an observation record.
 *
 * Both functions are recomputed from the record on every call; they hold no
 * state between calls.
 */

#include <cstddef>
#include <vector>

#include "acefit/ObservationRecord.hpp"

namespace acefit {

/**
 * @brief Atoms whose per-atom energies contribute rows.
 *
 * All atoms when the record has no mask key; otherwise the stored array cast
 * element-wise with @c value != 0.
 *
 * @param record The record.
 * @return One entry per atom.
 * @throws acefit::ShapeError if the stored mask is not a vector of length N.
 */
std::vector<bool> atom_mask(const ObservationRecord &record);

/**
 * @brief Force components that contribute rows.
 *
 * Each atom mask entry repeated three times, in atom order, so that the
 * result lines up with atom-major flattened forces.
 *
 * @param record The record.
 * @return @c 3 * N entries.
 */
std::vector<bool> force_mask(const ObservationRecord &record);

/**
 * @brief Number of selected entries.
 * @param mask A mask.
 * @return Count of @c true entries.
 */
size_t count_selected(const std::vector<bool> &mask);

} // namespace acefit
