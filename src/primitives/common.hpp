#ifndef QSTORE_PRIMITIVES_COMMON_HPP
#define QSTORE_PRIMITIVES_COMMON_HPP

#include <cstdint>

#include "base/blob.hpp"
#include "outcome/outcome.hpp"

namespace qstore::primitives {

  /// Position of a block in the certified chain
  using BlockNumber = uint64_t;

  /// Position of a block in the execution log, narrower than BlockNumber
  using ExecBlockNumber = uint32_t;

  using BatchNumber = uint32_t;

  using Address = base::Blob<20>;

  using BlockHash = base::Hash256;

  enum class PrimitivesError {
    DECODE_FAILED = 1,
    BLOCK_NUMBER_OVERFLOW,
  };

  /**
   * Narrow a consensus block number to the execution layer width
   * @return PrimitivesError::BLOCK_NUMBER_OVERFLOW if it does not fit
   */
  outcome::result<ExecBlockNumber> toExecBlockNumber(BlockNumber number);

}  // namespace qstore::primitives

OUTCOME_HPP_DECLARE_ERROR_2(qstore::primitives, PrimitivesError);

#endif  // QSTORE_PRIMITIVES_COMMON_HPP
