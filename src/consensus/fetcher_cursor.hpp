#ifndef QSTORE_CONSENSUS_FETCHER_CURSOR_HPP
#define QSTORE_CONSENSUS_FETCHER_CURSOR_HPP

#include <vector>

#include <boost/optional.hpp>
#include "base/logger.hpp"
#include "consensus/sync_action.hpp"
#include "storage/connection_pool.hpp"

namespace qstore::consensus {

  enum class CursorError {
    /// block is not the one the cursor expects next
    BLOCK_GAP = 1,
    /// block opens a batch which does not follow the current one
    BATCH_GAP,
  };

  /// Certified block as seen by the execution pipeline of a follower
  struct FetchedBlock {
    primitives::ExecBlockNumber number = 0;
    primitives::BatchNumber batch_number = 0;
    bool last_in_batch = false;
    uint16_t protocol_version = 0;
    uint64_t timestamp = 0;
    /// hash the block had on the node which sealed it
    primitives::BlockHash reference_hash;
    uint64_t l1_gas_price = 0;
    uint64_t l2_fair_gas_price = 0;
    uint32_t virtual_blocks = 0;
    primitives::Address operator_address;
    std::vector<primitives::Transaction> transactions;

    static FetchedBlock fromPayload(primitives::ExecBlockNumber number,
                                    const primitives::Payload &payload);
  };

  /**
   * Hash of an execution block, chained over its predecessor
   */
  primitives::BlockHash computeBlockHash(
      primitives::ExecBlockNumber number,
      uint64_t timestamp,
      const primitives::BlockHash &prev_block_hash,
      const std::vector<primitives::Transaction> &transactions);

  /**
   * Position of a follower's execution pipeline: the block it builds next,
   * the hash of the block before, and the batch it is filling
   */
  class FetcherCursor {
   public:
    FetcherCursor(primitives::ExecBlockNumber next_block,
                  primitives::BlockHash prev_block_hash,
                  boost::optional<primitives::BatchNumber> batch);

    /// Resume from the newest sealed block of the execution log
    static outcome::result<FetcherCursor> load(storage::Connection &conn);

    primitives::ExecBlockNumber nextBlock() const {
      return next_block_;
    }

    const primitives::BlockHash &prevBlockHash() const {
      return prev_block_hash_;
    }

    /// Batch of the last block built, none before the first block
    boost::optional<primitives::BatchNumber> batch() const {
      return batch_;
    }

    /**
     * Translate the next block into sync actions and move past it. The
     * cursor is unchanged on error.
     */
    outcome::result<std::vector<SyncAction>> advance(const FetchedBlock &block);

   private:
    primitives::ExecBlockNumber next_block_;
    primitives::BlockHash prev_block_hash_;
    boost::optional<primitives::BatchNumber> batch_;
    base::Logger logger_;
  };

}  // namespace qstore::consensus

OUTCOME_HPP_DECLARE_ERROR_2(qstore::consensus, CursorError);

#endif  // QSTORE_CONSENSUS_FETCHER_CURSOR_HPP
