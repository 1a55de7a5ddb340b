#ifndef QSTORE_APPLICATION_BRIDGE_NODE_HPP
#define QSTORE_APPLICATION_BRIDGE_NODE_HPP

#include <memory>

#include "application/bridge_config.hpp"
#include "base/logger.hpp"
#include "consensus/action_queue.hpp"
#include "consensus/store.hpp"
#include "storage/connection_pool.hpp"

namespace qstore::application {

  /**
   * Wires the block log, the connection pool and the consensus store of one
   * node together
   */
  class BridgeNode {
   public:
    /**
     * Open the log database named by the config, or an in-memory one if no
     * path is given
     */
    static outcome::result<std::unique_ptr<BridgeNode>> create(
        const BridgeConfig &config);

    /**
     * Create genesis if needed and, on followers, start forwarding blocks to
     * the action queue
     */
    outcome::result<void> start(const concurrency::Ctx &ctx);

    /// Refuse further database access
    void stop();

    std::shared_ptr<consensus::Store> store() const {
      return store_;
    }

    /// Action queue of a follower, null otherwise
    std::shared_ptr<consensus::ActionQueue> actionQueue() const {
      return action_queue_;
    }

    std::shared_ptr<storage::ConnectionPool> pool() const {
      return pool_;
    }

   private:
    BridgeNode(BridgeConfig config,
               std::shared_ptr<storage::LogDatabase> database);

    BridgeConfig config_;
    std::shared_ptr<storage::LogDatabase> database_;
    std::shared_ptr<storage::ConnectionPool> pool_;
    std::shared_ptr<crypto::ED25519Provider> crypto_provider_;
    std::shared_ptr<consensus::Store> store_;
    std::shared_ptr<consensus::ActionQueue> action_queue_;
    base::Logger logger_;
  };

}  // namespace qstore::application

#endif  // QSTORE_APPLICATION_BRIDGE_NODE_HPP
