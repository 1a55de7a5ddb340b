#ifndef QSTORE_APPLICATION_BRIDGE_CONFIG_HPP
#define QSTORE_APPLICATION_BRIDGE_CONFIG_HPP

#include <chrono>
#include <istream>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include "crypto/ed25519_types.hpp"
#include "primitives/common.hpp"

namespace qstore::application {

  /**
   * Settings of a node running the consensus bridge
   */
  struct BridgeConfig {
    /// RocksDB directory, empty keeps the log in memory
    std::string database_path;
    size_t pool_size = 8;
    std::chrono::milliseconds acquire_timeout{30000};

    primitives::Address operator_address;
    std::string node_id = "main";
    std::chrono::milliseconds poll_interval{50};
    /// secret seeds of the validators signing the genesis certificate
    std::vector<crypto::ED25519Seed> validator_keys;
    /// forward certified blocks to the execution pipeline
    bool follower = false;
    size_t action_queue_capacity = 1024;

    spdlog::level::level_enum log_level = spdlog::level::info;

    /**
     * Read the config from a JSON file
     * @return ConfigReaderError::PARSER_ERROR for malformed JSON,
     * MISSING_ENTRY or INVALID_VALUE for bad entries
     */
    static outcome::result<BridgeConfig> loadFromFile(const std::string &path);

    static outcome::result<BridgeConfig> loadFromStream(std::istream &input);
  };

}  // namespace qstore::application

#endif  // QSTORE_APPLICATION_BRIDGE_CONFIG_HPP
