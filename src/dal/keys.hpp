#ifndef QSTORE_DAL_KEYS_HPP
#define QSTORE_DAL_KEYS_HPP

#include <string_view>

#include "base/buffer.hpp"
#include "primitives/common.hpp"

namespace qstore::dal {

  /**
   * Tables of the log database. Every key starts with the table byte
   * followed by the big-endian row id, so key order is numeric order.
   */
  namespace prefix {
    enum Prefix : uint8_t {
      // consensus block number -> CertificateRecord
      CERTIFICATES = 1,

      // node id -> opaque replica state
      REPLICA_STATE,

      // execution block number -> BlockRecord
      BLOCKS,

      // batch number -> BatchRecord
      BATCHES,

      // single row: block number of the genesis certificate
      GENESIS,
    };
  }

  /// Key range of a whole table
  base::Buffer tablePrefix(prefix::Prefix table);

  base::Buffer certificateKey(primitives::BlockNumber number);

  base::Buffer replicaStateKey(std::string_view node_id);

  base::Buffer blockKey(primitives::ExecBlockNumber number);

  base::Buffer batchKey(primitives::BatchNumber number);

  base::Buffer genesisKey();

}  // namespace qstore::dal

#endif  // QSTORE_DAL_KEYS_HPP
