#include "primitives/common.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::primitives, PrimitivesError, e) {
  using E = qstore::primitives::PrimitivesError;
  switch (e) {
    case E::DECODE_FAILED:
      return "failed to decode record";
    case E::BLOCK_NUMBER_OVERFLOW:
      return "block number does not fit the execution block number";
  }
  return "unknown primitives error";
}

namespace qstore::primitives {

  outcome::result<ExecBlockNumber> toExecBlockNumber(BlockNumber number) {
    if (number > std::numeric_limits<ExecBlockNumber>::max()) {
      return PrimitivesError::BLOCK_NUMBER_OVERFLOW;
    }
    return static_cast<ExecBlockNumber>(number);
  }

}  // namespace qstore::primitives
