#include "dal/keys.hpp"

namespace qstore::dal {

  base::Buffer tablePrefix(prefix::Prefix table) {
    return base::Buffer{static_cast<uint8_t>(table)};
  }

  base::Buffer certificateKey(primitives::BlockNumber number) {
    return tablePrefix(prefix::CERTIFICATES).putUint64(number);
  }

  base::Buffer replicaStateKey(std::string_view node_id) {
    return tablePrefix(prefix::REPLICA_STATE).put(node_id);
  }

  base::Buffer blockKey(primitives::ExecBlockNumber number) {
    return tablePrefix(prefix::BLOCKS).putUint32(number);
  }

  base::Buffer batchKey(primitives::BatchNumber number) {
    return tablePrefix(prefix::BATCHES).putUint32(number);
  }

  base::Buffer genesisKey() {
    return tablePrefix(prefix::GENESIS);
  }

}  // namespace qstore::dal
