#ifndef QSTORE_CONSENSUS_STORE_ERROR_HPP
#define QSTORE_CONSENSUS_STORE_ERROR_HPP

#include "outcome/outcome.hpp"

namespace qstore::consensus {

  enum class StoreError {
    /// first certificate exists but the last one does not
    GENESIS_DISAPPEARED = 1,
    /// certificate exists but the execution log lost its block
    BLOCK_DISAPPEARED,
    MISSING_PARENT,
    PAYLOAD_MISMATCH,
    PAYLOAD_DECODE_FAILED,
    /// certificate does not attest the payload it comes with
    CERTIFICATE_MISMATCH,
    /// execution log has no sealed block to build genesis from
    NO_SEALED_BLOCK,
    /// block does not extend the certified chain by one
    NOT_NEXT_BLOCK,
  };

}  // namespace qstore::consensus

OUTCOME_HPP_DECLARE_ERROR_2(qstore::consensus, StoreError);

#endif  // QSTORE_CONSENSUS_STORE_ERROR_HPP
