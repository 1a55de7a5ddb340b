#ifndef QSTORE_DAL_CONSENSUS_DAL_HPP
#define QSTORE_DAL_CONSENSUS_DAL_HPP

#include <string>

#include <boost/optional.hpp>
#include "primitives/block.hpp"
#include "primitives/payload.hpp"
#include "storage/connection_pool.hpp"

namespace qstore::dal {

  /**
   * Access to the tables owned by consensus: certificates and replica
   * states. Every call is a single statement on the given connection.
   */
  class ConsensusDal {
   public:
    explicit ConsensusDal(storage::Connection &conn) : conn_{conn} {}

    /// Certificate with the lowest block number
    outcome::result<boost::optional<primitives::CommitQC>> firstCertificate();

    /// Certificate with the highest block number
    outcome::result<boost::optional<primitives::CommitQC>> lastCertificate();

    outcome::result<boost::optional<primitives::CommitQC>> certificate(
        primitives::BlockNumber number);

    /**
     * Store the certificate of a block together with the operator which
     * sealed it. Storing the very same certificate again does nothing.
     * @return DatabaseError::DUPLICATE_KEY if another certificate exists for
     * that number
     */
    outcome::result<void> insertCertificate(
        const primitives::CommitQC &qc,
        const primitives::Address &operator_address);

    /**
     * Record that genesis was created at the given block. Only one genesis
     * can ever be claimed, whatever block it is built on.
     * @return DatabaseError::DUPLICATE_KEY if genesis was already claimed
     */
    outcome::result<void> claimGenesis(primitives::BlockNumber number);

    outcome::result<boost::optional<primitives::ReplicaState>> replicaState(
        const std::string &node_id);

    outcome::result<void> setReplicaState(const std::string &node_id,
                                          const primitives::ReplicaState &state);

    /**
     * Payload of a sealed execution block as the given operator would
     * propose it, none if the block is not sealed yet
     */
    outcome::result<boost::optional<primitives::Payload>> blockPayload(
        primitives::ExecBlockNumber number,
        const primitives::Address &operator_address);

   private:
    storage::Connection &conn_;
  };

}  // namespace qstore::dal

#endif  // QSTORE_DAL_CONSENSUS_DAL_HPP
