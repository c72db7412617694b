#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Row layout of one observation record.
 *
 * The rows of a record are laid out as contiguous blocks in the fixed order
 *
 *   [energy: 1] [forces: sum(force_mask)] [virial: 6] [pae: sum(atom_mask)]
 *
 * where a block is present only if its observable resolved.  The design
 * matrix, target vector and weight vector are all filled against this
 * layout, which is what keeps them row-aligned.
 */

#include <cstddef>
#include <optional>
#include <vector>

#include "acefit/ObservationRecord.hpp"

namespace acefit {

/**
 * @struct RowBlock
 * @brief One contiguous run of rows.
 */
struct RowBlock {
  Observable kind; //!< Observable filling the block.
  size_t offset;   //!< First row, relative to the record.
  size_t rows;     //!< Number of rows.
};

/**
 * @class RowLayout
 * @brief Ordered blocks of one record.
 * @ingroup acefit
 */
class RowLayout {
public:
  /**
   * @brief Computes the layout.
   * @param record The record.
   */
  explicit RowLayout(const ObservationRecord &record);

  const std::vector<RowBlock> &blocks() const { return m_blocks; }

  /**
   * @brief Total number of rows.
   * @return Sum of the block sizes.
   */
  size_t rows() const { return m_rows; }

  /**
   * @brief Block of one observable.
   * @param obs The observable.
   * @return The block, or an empty optional if the observable is inactive.
   */
  std::optional<RowBlock> block(Observable obs) const;

private:
  std::vector<RowBlock> m_blocks; //!< Active blocks in row order.
  size_t m_rows = 0;              //!< Total row count.
};

/**
 * @brief Number of rows a record contributes.
 * @param record The record.
 * @return The row count.
 */
size_t count_observations(const ObservationRecord &record);

/**
 * @brief Number of rows of a collection of records.
 * @param records The records.
 * @return Sum of the per-record row counts.
 */
size_t count_observations(const std::vector<ObservationRecord> &records);

} // namespace acefit
