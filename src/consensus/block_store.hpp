#ifndef QSTORE_CONSENSUS_BLOCK_STORE_HPP
#define QSTORE_CONSENSUS_BLOCK_STORE_HPP

#include <boost/optional.hpp>
#include "concurrency/ctx.hpp"
#include "primitives/block.hpp"

namespace qstore::consensus {

  /**
   * Durable chain of certified blocks as seen by the consensus engine
   */
  class PersistentBlockStore {
   public:
    virtual ~PersistentBlockStore() = default;

    /**
     * Range of certified blocks
     * @return none before genesis
     */
    virtual outcome::result<boost::optional<primitives::BlockStoreState>>
    state(const concurrency::Ctx &ctx) = 0;

    /**
     * Certified block by number
     * @return none if the block is not certified
     */
    virtual outcome::result<boost::optional<primitives::FinalBlock>> block(
        const concurrency::Ctx &ctx, primitives::BlockNumber number) = 0;

    /**
     * Persist the block following the current last one. Returns once the
     * certificate is durable.
     * @return StoreError::NOT_NEXT_BLOCK if the block does not follow the
     * last certified one
     */
    virtual outcome::result<void> storeNextBlock(
        const concurrency::Ctx &ctx, const primitives::FinalBlock &block) = 0;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_BLOCK_STORE_HPP
