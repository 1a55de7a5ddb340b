#include "primitives/payload.hpp"

namespace qstore::primitives {

  bool Payload::operator==(const Payload &other) const {
    return hash == other.hash && batch_number == other.batch_number
           && last_in_batch == other.last_in_batch
           && protocol_version == other.protocol_version
           && timestamp == other.timestamp
           && l1_gas_price == other.l1_gas_price
           && l2_fair_gas_price == other.l2_fair_gas_price
           && virtual_blocks == other.virtual_blocks
           && operator_address == other.operator_address
           && transactions == other.transactions;
  }

  std::ostream &operator<<(std::ostream &os, const Payload &payload) {
    os << "Payload{hash: " << payload.hash
       << ", batch: " << payload.batch_number
       << ", last_in_batch: " << payload.last_in_batch
       << ", protocol_version: " << payload.protocol_version
       << ", timestamp: " << payload.timestamp
       << ", l1_gas_price: " << payload.l1_gas_price
       << ", l2_fair_gas_price: " << payload.l2_fair_gas_price
       << ", virtual_blocks: " << payload.virtual_blocks
       << ", operator: " << payload.operator_address << ", txs: [";
    for (size_t i = 0; i < payload.transactions.size(); ++i) {
      os << (i == 0 ? "" : ", ") << payload.transactions[i].hash;
    }
    return os << "]}";
  }

}  // namespace qstore::primitives
