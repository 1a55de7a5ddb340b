#ifndef QSTORE_CONSENSUS_REPLICA_STORE_HPP
#define QSTORE_CONSENSUS_REPLICA_STORE_HPP

#include <boost/optional.hpp>
#include "concurrency/ctx.hpp"
#include "primitives/block.hpp"

namespace qstore::consensus {

  /**
   * Voting state of the local replica
   */
  class ReplicaStore {
   public:
    virtual ~ReplicaStore() = default;

    /// @return none if the state was never written
    virtual outcome::result<boost::optional<primitives::ReplicaState>>
    replicaState(const concurrency::Ctx &ctx) = 0;

    /// Replace the state as a whole
    virtual outcome::result<void> setReplicaState(
        const concurrency::Ctx &ctx, const primitives::ReplicaState &state) = 0;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_REPLICA_STORE_HPP
