#include "dal/consensus_dal.hpp"

#include "dal/blocks_dal.hpp"
#include "dal/keys.hpp"
#include "dal/proto/records.pb.h"
#include "primitives/codec.hpp"
#include "storage/database_error.hpp"

namespace qstore::dal {

  using base::Buffer;
  using primitives::Address;
  using primitives::CommitQC;
  using primitives::PrimitivesError;
  using storage::DatabaseError;
  using storage::LogTransaction;

  namespace {
    struct CertificateRow {
      Address operator_address;
      CommitQC qc;
    };

    Buffer encodeCertificate(const CommitQC &qc,
                             const Address &operator_address) {
      proto::CertificateRecord record;
      record.set_operator_address(operator_address.toString());
      record.set_certificate(primitives::encodeCommitQC(qc).toString());
      return Buffer::fromString(record.SerializeAsString());
    }

    outcome::result<CertificateRow> decodeCertificate(const Buffer &bytes) {
      proto::CertificateRecord record;
      if (!record.ParseFromArray(bytes.data(),
                                 static_cast<int>(bytes.size()))) {
        return PrimitivesError::DECODE_FAILED;
      }
      auto address = Address::fromString(record.operator_address());
      if (!address) {
        return PrimitivesError::DECODE_FAILED;
      }
      OUTCOME_TRY(
          (auto &&, qc),
          primitives::decodeCommitQC(Buffer::fromString(record.certificate())));
      return CertificateRow{address.value(), std::move(qc)};
    }

    outcome::result<boost::optional<CommitQC>> certificateOf(
        const outcome::result<boost::optional<storage::LogEntry>> &entry) {
      if (!entry) {
        return entry.error();
      }
      if (!entry.value()) {
        return boost::none;
      }
      OUTCOME_TRY((auto &&, row), decodeCertificate(entry.value()->second));
      return boost::make_optional(std::move(row.qc));
    }
  }  // namespace

  outcome::result<boost::optional<CommitQC>> ConsensusDal::firstCertificate() {
    return conn_.run([](LogTransaction &txn) {
      return certificateOf(txn.first(tablePrefix(prefix::CERTIFICATES)));
    });
  }

  outcome::result<boost::optional<CommitQC>> ConsensusDal::lastCertificate() {
    return conn_.run([](LogTransaction &txn) {
      return certificateOf(txn.last(tablePrefix(prefix::CERTIFICATES)));
    });
  }

  outcome::result<boost::optional<CommitQC>> ConsensusDal::certificate(
      primitives::BlockNumber number) {
    return conn_.run([&](LogTransaction &txn)
                         -> outcome::result<boost::optional<CommitQC>> {
      auto bytes = txn.get(certificateKey(number));
      if (!bytes) {
        if (bytes.error() == DatabaseError::NOT_FOUND) {
          return boost::none;
        }
        return bytes.error();
      }
      OUTCOME_TRY((auto &&, row), decodeCertificate(bytes.value()));
      return boost::make_optional(std::move(row.qc));
    });
  }

  outcome::result<void> ConsensusDal::insertCertificate(
      const CommitQC &qc, const Address &operator_address) {
    auto key = certificateKey(qc.number());
    return conn_.run([&](LogTransaction &txn) -> outcome::result<void> {
      auto existing = txn.get(key);
      if (existing) {
        OUTCOME_TRY((auto &&, row), decodeCertificate(existing.value()));
        if (row.qc == qc && row.operator_address == operator_address) {
          return outcome::success();
        }
        return DatabaseError::DUPLICATE_KEY;
      }
      if (existing.error() != DatabaseError::NOT_FOUND) {
        return existing.error();
      }
      return txn.insert(key, encodeCertificate(qc, operator_address));
    });
  }

  outcome::result<void> ConsensusDal::claimGenesis(
      primitives::BlockNumber number) {
    return conn_.run([&](LogTransaction &txn) {
      return txn.insert(genesisKey(), Buffer{}.putUint64(number));
    });
  }

  outcome::result<boost::optional<primitives::ReplicaState>>
  ConsensusDal::replicaState(const std::string &node_id) {
    return conn_.run(
        [&](LogTransaction &txn)
            -> outcome::result<boost::optional<primitives::ReplicaState>> {
          auto bytes = txn.get(replicaStateKey(node_id));
          if (!bytes) {
            if (bytes.error() == DatabaseError::NOT_FOUND) {
              return boost::none;
            }
            return bytes.error();
          }
          return boost::make_optional(std::move(bytes.value()));
        });
  }

  outcome::result<void> ConsensusDal::setReplicaState(
      const std::string &node_id, const primitives::ReplicaState &state) {
    return conn_.run([&](LogTransaction &txn) {
      return txn.put(replicaStateKey(node_id), state);
    });
  }

  outcome::result<boost::optional<primitives::Payload>>
  ConsensusDal::blockPayload(primitives::ExecBlockNumber number,
                             const Address &operator_address) {
    OUTCOME_TRY((auto &&, block), BlocksDal(conn_).block(number));
    if (!block) {
      return boost::none;
    }
    primitives::Payload payload;
    payload.hash = block->hash;
    payload.batch_number = block->batch_number;
    payload.last_in_batch = block->last_in_batch;
    payload.protocol_version = block->protocol_version;
    payload.timestamp = block->timestamp;
    payload.l1_gas_price = block->l1_gas_price;
    payload.l2_fair_gas_price = block->l2_fair_gas_price;
    payload.virtual_blocks = block->virtual_blocks;
    payload.operator_address = operator_address;
    payload.transactions = std::move(block->transactions);
    return boost::make_optional(std::move(payload));
  }

}  // namespace qstore::dal
