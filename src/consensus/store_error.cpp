#include "consensus/store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::consensus, StoreError, e) {
  using E = qstore::consensus::StoreError;
  switch (e) {
    case E::GENESIS_DISAPPEARED:
      return "genesis certificate disappeared from the block store";
    case E::BLOCK_DISAPPEARED:
      return "certified block disappeared from the execution log";
    case E::MISSING_PARENT:
      return "certificate of the parent block is missing";
    case E::PAYLOAD_MISMATCH:
      return "payload does not match the locally proposed one";
    case E::PAYLOAD_DECODE_FAILED:
      return "failed to decode payload";
    case E::CERTIFICATE_MISMATCH:
      return "certificate does not match the block payload";
    case E::NO_SEALED_BLOCK:
      return "execution log has no sealed block";
    case E::NOT_NEXT_BLOCK:
      return "block does not follow the last certified block";
  }
  return "unknown StoreError";
}
