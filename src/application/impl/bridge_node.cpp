#include "application/bridge_node.hpp"

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "storage/in_memory/in_memory_log_database.hpp"
#include "storage/rocksdb/rocksdb_log_database.hpp"

namespace qstore::application {

  outcome::result<std::unique_ptr<BridgeNode>> BridgeNode::create(
      const BridgeConfig &config) {
    std::shared_ptr<storage::LogDatabase> database;
    if (config.database_path.empty()) {
      database = std::make_shared<storage::InMemoryLogDatabase>();
    } else {
      storage::RocksLogDatabase::Options options;
      options.create_if_missing = true;
      OUTCOME_TRY((auto &&, rocks),
                  storage::RocksLogDatabase::create(config.database_path,
                                                    options));
      database = rocks;
    }
    return std::unique_ptr<BridgeNode>(
        new BridgeNode(config, std::move(database)));
  }

  BridgeNode::BridgeNode(BridgeConfig config,
                         std::shared_ptr<storage::LogDatabase> database)
      : config_{std::move(config)},
        database_{std::move(database)},
        pool_{storage::ConnectionPool::create(
            database_, config_.pool_size, config_.acquire_timeout)},
        crypto_provider_{std::make_shared<crypto::ED25519ProviderImpl>()},
        logger_{base::createLogger("BridgeNode")} {
    consensus::StoreConfig store_config;
    store_config.operator_address = config_.operator_address;
    store_config.node_id = config_.node_id;
    store_config.poll_interval = config_.poll_interval;
    store_ = std::make_shared<consensus::Store>(
        pool_, crypto_provider_, std::move(store_config));
    logger_->info("{} opened, pool of {} connections",
                  database_->GetName(),
                  config_.pool_size);
  }

  outcome::result<void> BridgeNode::start(const concurrency::Ctx &ctx) {
    std::vector<crypto::ED25519Keypair> keys;
    keys.reserve(config_.validator_keys.size());
    for (const auto &seed : config_.validator_keys) {
      OUTCOME_TRY((auto &&, keypair), crypto_provider_->generateKeypair(seed));
      keys.push_back(keypair);
    }
    BOOST_OUTCOME_TRYV2(auto &&, store_->tryInitGenesis(ctx, keys));

    if (config_.follower) {
      action_queue_ = std::make_shared<consensus::ActionQueue>(
          config_.action_queue_capacity);
      BOOST_OUTCOME_TRYV2(
          auto &&,
          store_->setActionsQueue(ctx, consensus::ActionQueueSender(action_queue_)));
    }
    return outcome::success();
  }

  void BridgeNode::stop() {
    pool_->close();
  }

}  // namespace qstore::application
