#include "consensus/sync_action.hpp"

namespace qstore::consensus {

  std::ostream &operator<<(std::ostream &os, const OpenBatch &action) {
    return os << "OpenBatch{number: " << action.number
              << ", timestamp: " << action.timestamp
              << ", first_block: " << action.first_block_number << "}";
  }

  std::ostream &operator<<(std::ostream &os, const Miniblock &action) {
    return os << "Miniblock{number: " << action.number
              << ", timestamp: " << action.timestamp << "}";
  }

  std::ostream &operator<<(std::ostream &os, const Tx &action) {
    return os << "Tx{" << action.tx.hash << "}";
  }

  std::ostream &operator<<(std::ostream &os, const SealMiniblock &) {
    return os << "SealMiniblock";
  }

  std::ostream &operator<<(std::ostream &os, const SealBatch &action) {
    return os << "SealBatch{virtual_blocks: " << action.virtual_blocks << "}";
  }

}  // namespace qstore::consensus
