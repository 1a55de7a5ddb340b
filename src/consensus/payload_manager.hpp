#ifndef QSTORE_CONSENSUS_PAYLOAD_MANAGER_HPP
#define QSTORE_CONSENSUS_PAYLOAD_MANAGER_HPP

#include "base/buffer.hpp"
#include "concurrency/ctx.hpp"
#include "primitives/common.hpp"

namespace qstore::consensus {

  /**
   * Source and judge of block payloads
   */
  class PayloadManager {
   public:
    virtual ~PayloadManager() = default;

    /**
     * Encoded payload this node proposes for the block, available once the
     * execution pipeline sealed it
     */
    virtual outcome::result<base::Buffer> propose(
        const concurrency::Ctx &ctx, primitives::BlockNumber number) = 0;

    /**
     * Check that a proposed payload is the one this node would propose
     */
    virtual outcome::result<void> verify(const concurrency::Ctx &ctx,
                                         primitives::BlockNumber number,
                                         const base::Buffer &payload) = 0;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_PAYLOAD_MANAGER_HPP
