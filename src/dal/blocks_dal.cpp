#include "dal/blocks_dal.hpp"

#include <limits>

#include "dal/keys.hpp"
#include "dal/proto/records.pb.h"
#include "storage/database_error.hpp"

namespace qstore::dal {

  using base::Buffer;
  using primitives::BatchNumber;
  using primitives::ExecBlockNumber;
  using primitives::PrimitivesError;
  using storage::LogTransaction;

  namespace {
    Buffer encodeBlock(const SealedBlock &block) {
      proto::BlockRecord record;
      record.set_number(block.number);
      record.set_batch_number(block.batch_number);
      record.set_last_in_batch(block.last_in_batch);
      record.set_protocol_version(block.protocol_version);
      record.set_timestamp(block.timestamp);
      record.set_hash(block.hash.toString());
      record.set_l1_gas_price(block.l1_gas_price);
      record.set_l2_fair_gas_price(block.l2_fair_gas_price);
      record.set_virtual_blocks(block.virtual_blocks);
      for (const auto &tx : block.transactions) {
        auto *out = record.add_transactions();
        out->set_raw(tx.raw.toString());
        out->set_hash(tx.hash.toString());
      }
      return Buffer::fromString(record.SerializeAsString());
    }

    outcome::result<SealedBlock> decodeBlock(const Buffer &bytes) {
      proto::BlockRecord record;
      if (!record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))
          || record.protocol_version() > std::numeric_limits<uint16_t>::max()) {
        return PrimitivesError::DECODE_FAILED;
      }
      auto hash = base::Hash256::fromString(record.hash());
      if (!hash) {
        return PrimitivesError::DECODE_FAILED;
      }

      SealedBlock block;
      block.number = record.number();
      block.batch_number = record.batch_number();
      block.last_in_batch = record.last_in_batch();
      block.protocol_version = static_cast<uint16_t>(record.protocol_version());
      block.timestamp = record.timestamp();
      block.hash = hash.value();
      block.l1_gas_price = record.l1_gas_price();
      block.l2_fair_gas_price = record.l2_fair_gas_price();
      block.virtual_blocks = record.virtual_blocks();
      for (const auto &tx : record.transactions()) {
        auto tx_hash = base::Hash256::fromString(tx.hash());
        if (!tx_hash) {
          return PrimitivesError::DECODE_FAILED;
        }
        block.transactions.push_back(primitives::Transaction{
            Buffer::fromString(tx.raw()), tx_hash.value()});
      }
      return block;
    }

    outcome::result<SealedBatch> decodeBatch(const Buffer &bytes) {
      proto::BatchRecord record;
      if (!record.ParseFromArray(bytes.data(),
                                 static_cast<int>(bytes.size()))) {
        return PrimitivesError::DECODE_FAILED;
      }
      return SealedBatch{record.number(), record.timestamp()};
    }
  }  // namespace

  outcome::result<boost::optional<ExecBlockNumber>>
  BlocksDal::lastSealedBlockNumber() {
    OUTCOME_TRY((auto &&, block), lastSealedBlock());
    if (!block) {
      return boost::none;
    }
    return boost::make_optional(block->number);
  }

  outcome::result<boost::optional<SealedBlock>> BlocksDal::block(
      ExecBlockNumber number) {
    return conn_.run([&](LogTransaction &txn)
                         -> outcome::result<boost::optional<SealedBlock>> {
      auto bytes = txn.get(blockKey(number));
      if (!bytes) {
        if (bytes.error() == storage::DatabaseError::NOT_FOUND) {
          return boost::none;
        }
        return bytes.error();
      }
      OUTCOME_TRY((auto &&, block), decodeBlock(bytes.value()));
      return boost::make_optional(std::move(block));
    });
  }

  outcome::result<boost::optional<SealedBlock>> BlocksDal::lastSealedBlock() {
    return conn_.run([&](LogTransaction &txn)
                         -> outcome::result<boost::optional<SealedBlock>> {
      OUTCOME_TRY((auto &&, entry), txn.last(tablePrefix(prefix::BLOCKS)));
      if (!entry) {
        return boost::none;
      }
      OUTCOME_TRY((auto &&, block), decodeBlock(entry->second));
      return boost::make_optional(std::move(block));
    });
  }

  outcome::result<boost::optional<BatchNumber>>
  BlocksDal::lastSealedBatchNumber() {
    return conn_.run([&](LogTransaction &txn)
                         -> outcome::result<boost::optional<BatchNumber>> {
      OUTCOME_TRY((auto &&, entry), txn.last(tablePrefix(prefix::BATCHES)));
      if (!entry) {
        return boost::none;
      }
      OUTCOME_TRY((auto &&, batch), decodeBatch(entry->second));
      return boost::make_optional(batch.number);
    });
  }

  outcome::result<bool> BlocksDal::pendingBatchExists() {
    OUTCOME_TRY((auto &&, block), lastSealedBlock());
    if (!block) {
      return false;
    }
    OUTCOME_TRY((auto &&, batch), lastSealedBatchNumber());
    return !batch || block->batch_number > *batch;
  }

  outcome::result<void> BlocksDal::insertBlock(const SealedBlock &block) {
    return conn_.run([&](LogTransaction &txn) {
      return txn.insert(blockKey(block.number), encodeBlock(block));
    });
  }

  outcome::result<void> BlocksDal::insertBatch(const SealedBatch &batch) {
    proto::BatchRecord record;
    record.set_number(batch.number);
    record.set_timestamp(batch.timestamp);
    auto value = Buffer::fromString(record.SerializeAsString());
    return conn_.run([&](LogTransaction &txn) {
      return txn.insert(batchKey(batch.number), value);
    });
  }

}  // namespace qstore::dal
