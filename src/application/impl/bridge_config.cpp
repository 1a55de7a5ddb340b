#include "application/bridge_config.hpp"

#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include "application/impl/config_reader/pt_util.hpp"

namespace qstore::application {

  namespace pt = boost::property_tree;

  outcome::result<BridgeConfig> BridgeConfig::loadFromFile(
      const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return loadFromStream(input);
  }

  outcome::result<BridgeConfig> BridgeConfig::loadFromStream(
      std::istream &input) {
    pt::ptree tree;
    try {
      pt::read_json(input, tree);
    } catch (const pt::json_parser_error &) {
      return ConfigReaderError::PARSER_ERROR;
    }

    BridgeConfig config;

    config.database_path = tree.get<std::string>("database.path", "");
    OUTCOME_TRY((auto &&, pool_size),
                optionalEntry<size_t>(tree, "database.pool_size", 8));
    if (pool_size == 0) {
      return ConfigReaderError::INVALID_VALUE;
    }
    config.pool_size = pool_size;
    OUTCOME_TRY(
        (auto &&, acquire_timeout),
        optionalEntry<uint64_t>(tree, "database.acquire_timeout_ms", 30000));
    config.acquire_timeout = std::chrono::milliseconds(acquire_timeout);

    OUTCOME_TRY((auto &&, operator_hex),
                ensure(tree.get_optional<std::string>(
                    "consensus.operator_address")));
    auto address = primitives::Address::fromHexWithPrefix(operator_hex);
    if (!address) {
      address = primitives::Address::fromHex(operator_hex);
    }
    if (!address) {
      return ConfigReaderError::INVALID_VALUE;
    }
    config.operator_address = address.value();

    OUTCOME_TRY((auto &&, node_id),
                optionalEntry<std::string>(tree, "consensus.node_id", "main"));
    config.node_id = node_id;
    OUTCOME_TRY(
        (auto &&, poll_interval),
        optionalEntry<uint64_t>(tree, "consensus.poll_interval_ms", 50));
    config.poll_interval = std::chrono::milliseconds(poll_interval);
    OUTCOME_TRY((auto &&, follower),
                optionalEntry<bool>(tree, "consensus.follower", false));
    config.follower = follower;
    OUTCOME_TRY((auto &&, capacity),
                optionalEntry<size_t>(
                    tree, "consensus.action_queue_capacity", 1024));
    config.action_queue_capacity = capacity;

    if (auto keys = tree.get_child_optional("consensus.validator_keys")) {
      for (const auto &[_, key] : *keys) {
        auto seed = crypto::ED25519Seed::fromHexWithPrefix(key.data());
        if (!seed) {
          seed = crypto::ED25519Seed::fromHex(key.data());
        }
        if (!seed) {
          return ConfigReaderError::INVALID_VALUE;
        }
        config.validator_keys.push_back(seed.value());
      }
    }

    auto level = tree.get<std::string>("log_level", "info");
    config.log_level = spdlog::level::from_str(level);
    if (config.log_level == spdlog::level::off && level != "off") {
      return ConfigReaderError::INVALID_VALUE;
    }
    return config;
  }

}  // namespace qstore::application
