#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

#include "application/bridge_node.hpp"

namespace po = boost::program_options;

using qstore::application::BridgeConfig;
using qstore::application::BridgeNode;

int main(int argc, char **argv) {
  po::options_description desc("QuorumStore node options");
  // clang-format off
  desc.add_options()
      ("help,h", "Print this help")
      ("config,c", po::value<std::string>(), "Path to the JSON config file")
      ("log-level", po::value<std::string>(), "Override the log level of the config");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << std::endl << desc << std::endl;
    return EXIT_FAILURE;
  }
  if (vm.count("help") != 0 || vm.count("config") == 0) {
    std::cout << desc << std::endl;
    return vm.count("help") != 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  auto logger = qstore::base::createLogger("main");

  auto config = BridgeConfig::loadFromFile(vm["config"].as<std::string>());
  if (!config) {
    logger->error("cannot read config: {}", config.error().message());
    return EXIT_FAILURE;
  }
  auto level = config.value().log_level;
  if (vm.count("log-level") != 0) {
    level = spdlog::level::from_str(vm["log-level"].as<std::string>());
  }
  qstore::base::setLogLevel(level);

  auto node = BridgeNode::create(config.value());
  if (!node) {
    logger->error("cannot open the block log: {}", node.error().message());
    return EXIT_FAILURE;
  }

  auto ctx = qstore::concurrency::Ctx::background();
  auto started = node.value()->start(ctx);
  if (!started) {
    logger->error("bootstrap failed: {}", started.error().message());
    return EXIT_FAILURE;
  }

  auto state = node.value()->store()->state(ctx);
  if (!state) {
    logger->error("cannot read the block store: {}", state.error().message());
    return EXIT_FAILURE;
  }
  if (state.value()) {
    logger->info("certified blocks {}..{}",
                 state.value()->first(),
                 state.value()->last());
  }
  node.value()->stop();
  return EXIT_SUCCESS;
}
