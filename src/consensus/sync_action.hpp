#ifndef QSTORE_CONSENSUS_SYNC_ACTION_HPP
#define QSTORE_CONSENSUS_SYNC_ACTION_HPP

#include <ostream>

#include <boost/variant.hpp>
#include "primitives/payload.hpp"

namespace qstore::consensus {

  /**
   * Block construction instructions consumed by the execution pipeline of a
   * follower node
   */

  /// Starts a batch together with its first block
  struct OpenBatch {
    primitives::BatchNumber number = 0;
    uint64_t timestamp = 0;
    uint64_t l1_gas_price = 0;
    uint64_t l2_fair_gas_price = 0;
    primitives::Address operator_address;
    uint16_t protocol_version = 0;
    primitives::ExecBlockNumber first_block_number = 0;
    uint32_t first_block_virtual_blocks = 0;
    primitives::BlockHash prev_block_hash;

    bool operator==(const OpenBatch &other) const {
      return number == other.number && timestamp == other.timestamp
             && l1_gas_price == other.l1_gas_price
             && l2_fair_gas_price == other.l2_fair_gas_price
             && operator_address == other.operator_address
             && protocol_version == other.protocol_version
             && first_block_number == other.first_block_number
             && first_block_virtual_blocks == other.first_block_virtual_blocks
             && prev_block_hash == other.prev_block_hash;
    }
  };

  /// Starts a block inside the open batch
  struct Miniblock {
    primitives::ExecBlockNumber number = 0;
    uint64_t timestamp = 0;
    uint32_t virtual_blocks = 0;

    bool operator==(const Miniblock &other) const {
      return number == other.number && timestamp == other.timestamp
             && virtual_blocks == other.virtual_blocks;
    }
  };

  struct Tx {
    primitives::Transaction tx;

    bool operator==(const Tx &other) const {
      return tx == other.tx;
    }
  };

  struct SealMiniblock {
    bool operator==(const SealMiniblock &) const {
      return true;
    }
  };

  /// Seals the last block and the batch it closes
  struct SealBatch {
    uint32_t virtual_blocks = 0;

    bool operator==(const SealBatch &other) const {
      return virtual_blocks == other.virtual_blocks;
    }
  };

  using SyncAction =
      boost::variant<OpenBatch, Miniblock, Tx, SealMiniblock, SealBatch>;

  std::ostream &operator<<(std::ostream &os, const OpenBatch &action);
  std::ostream &operator<<(std::ostream &os, const Miniblock &action);
  std::ostream &operator<<(std::ostream &os, const Tx &action);
  std::ostream &operator<<(std::ostream &os, const SealMiniblock &action);
  std::ostream &operator<<(std::ostream &os, const SealBatch &action);

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_SYNC_ACTION_HPP
