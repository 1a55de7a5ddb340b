#ifndef QSTORE_DAL_BLOCKS_DAL_HPP
#define QSTORE_DAL_BLOCKS_DAL_HPP

#include <vector>

#include <boost/optional.hpp>
#include "primitives/payload.hpp"
#include "storage/connection_pool.hpp"

namespace qstore::dal {

  /// Execution block as sealed into the log
  struct SealedBlock {
    primitives::ExecBlockNumber number = 0;
    primitives::BatchNumber batch_number = 0;
    bool last_in_batch = false;
    uint16_t protocol_version = 0;
    uint64_t timestamp = 0;
    primitives::BlockHash hash;
    uint64_t l1_gas_price = 0;
    uint64_t l2_fair_gas_price = 0;
    uint32_t virtual_blocks = 0;
    std::vector<primitives::Transaction> transactions;
  };

  struct SealedBatch {
    primitives::BatchNumber number = 0;
    uint64_t timestamp = 0;
  };

  /**
   * Access to the tables written by the execution pipeline. The bridge only
   * reads them; the writers are used by the pipeline itself.
   */
  class BlocksDal {
   public:
    explicit BlocksDal(storage::Connection &conn) : conn_{conn} {}

    /// Number of the newest sealed block, none if nothing is sealed
    outcome::result<boost::optional<primitives::ExecBlockNumber>>
    lastSealedBlockNumber();

    outcome::result<boost::optional<SealedBlock>> block(
        primitives::ExecBlockNumber number);

    outcome::result<boost::optional<SealedBlock>> lastSealedBlock();

    outcome::result<boost::optional<primitives::BatchNumber>>
    lastSealedBatchNumber();

    /// True if some sealed block belongs to a batch which is not sealed yet
    outcome::result<bool> pendingBatchExists();

    /**
     * Seal a block
     * @return DatabaseError::DUPLICATE_KEY if the number is taken
     */
    outcome::result<void> insertBlock(const SealedBlock &block);

    outcome::result<void> insertBatch(const SealedBatch &batch);

   private:
    storage::Connection &conn_;
  };

}  // namespace qstore::dal

#endif  // QSTORE_DAL_BLOCKS_DAL_HPP
