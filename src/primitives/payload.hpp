#ifndef QSTORE_PRIMITIVES_PAYLOAD_HPP
#define QSTORE_PRIMITIVES_PAYLOAD_HPP

#include <ostream>
#include <vector>

#include "base/buffer.hpp"
#include "primitives/common.hpp"

namespace qstore::primitives {

  struct Transaction {
    base::Buffer raw;
    base::Hash256 hash;

    bool operator==(const Transaction &other) const {
      return raw == other.raw && hash == other.hash;
    }
    bool operator!=(const Transaction &other) const {
      return !(*this == other);
    }
  };

  /**
   * Ordered transactions of one sealed execution block together with the
   * block metadata
   */
  struct Payload {
    /// hash of the block as computed by the execution pipeline
    BlockHash hash;
    BatchNumber batch_number = 0;
    bool last_in_batch = false;
    uint16_t protocol_version = 0;
    uint64_t timestamp = 0;
    uint64_t l1_gas_price = 0;
    uint64_t l2_fair_gas_price = 0;
    uint32_t virtual_blocks = 0;
    Address operator_address;
    std::vector<Transaction> transactions;

    bool operator==(const Payload &other) const;
    bool operator!=(const Payload &other) const {
      return !(*this == other);
    }
  };

  std::ostream &operator<<(std::ostream &os, const Payload &payload);

}  // namespace qstore::primitives

#endif  // QSTORE_PRIMITIVES_PAYLOAD_HPP
