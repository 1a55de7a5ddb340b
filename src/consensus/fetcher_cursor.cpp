#include "consensus/fetcher_cursor.hpp"

#include "crypto/sha/sha256.hpp"
#include "dal/blocks_dal.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::consensus, CursorError, e) {
  using E = qstore::consensus::CursorError;
  switch (e) {
    case E::BLOCK_GAP:
      return "block does not follow the fetcher cursor";
    case E::BATCH_GAP:
      return "batch does not follow the fetcher cursor";
  }
  return "unknown CursorError";
}

namespace qstore::consensus {

  using primitives::BatchNumber;
  using primitives::BlockHash;
  using primitives::ExecBlockNumber;

  FetchedBlock FetchedBlock::fromPayload(ExecBlockNumber number,
                                         const primitives::Payload &payload) {
    FetchedBlock block;
    block.number = number;
    block.batch_number = payload.batch_number;
    block.last_in_batch = payload.last_in_batch;
    block.protocol_version = payload.protocol_version;
    block.timestamp = payload.timestamp;
    block.reference_hash = payload.hash;
    block.l1_gas_price = payload.l1_gas_price;
    block.l2_fair_gas_price = payload.l2_fair_gas_price;
    block.virtual_blocks = payload.virtual_blocks;
    block.operator_address = payload.operator_address;
    block.transactions = payload.transactions;
    return block;
  }

  BlockHash computeBlockHash(
      ExecBlockNumber number,
      uint64_t timestamp,
      const BlockHash &prev_block_hash,
      const std::vector<primitives::Transaction> &transactions) {
    base::Buffer digest;
    digest.reserve(4 + 8 + BlockHash::size() * (1 + transactions.size()));
    digest.putUint32(number).putUint64(timestamp).put(prev_block_hash);
    for (const auto &tx : transactions) {
      digest.put(tx.hash);
    }
    return crypto::sha256(digest.toVector());
  }

  FetcherCursor::FetcherCursor(ExecBlockNumber next_block,
                               BlockHash prev_block_hash,
                               boost::optional<BatchNumber> batch)
      : next_block_{next_block},
        prev_block_hash_{prev_block_hash},
        batch_{batch},
        logger_{base::createLogger("FetcherCursor")} {}

  outcome::result<FetcherCursor> FetcherCursor::load(
      storage::Connection &conn) {
    dal::BlocksDal blocks(conn);
    OUTCOME_TRY((auto &&, last_block), blocks.lastSealedBlock());
    if (!last_block) {
      return FetcherCursor(0, BlockHash{}, boost::none);
    }
    OUTCOME_TRY((auto &&, last_batch), blocks.lastSealedBatchNumber());
    OUTCOME_TRY((auto &&, pending), blocks.pendingBatchExists());

    // the batch blocks are being added to, or the last one sealed
    boost::optional<BatchNumber> batch = last_batch;
    if (pending) {
      batch = last_batch ? *last_batch + 1 : last_block->batch_number;
    }
    return FetcherCursor(last_block->number + 1, last_block->hash, batch);
  }

  outcome::result<std::vector<SyncAction>> FetcherCursor::advance(
      const FetchedBlock &block) {
    if (block.number != next_block_) {
      logger_->warn("block {} does not follow the cursor at {}",
                    block.number,
                    next_block_);
      return CursorError::BLOCK_GAP;
    }

    std::vector<SyncAction> actions;
    actions.reserve(block.transactions.size() + 2);

    bool new_batch = !batch_ || block.batch_number != *batch_;
    if (new_batch) {
      BatchNumber expected = batch_ ? *batch_ + 1 : 0;
      if (block.batch_number != expected) {
        logger_->warn("block {} opens batch {}, expected batch {}",
                      block.number,
                      block.batch_number,
                      expected);
        return CursorError::BATCH_GAP;
      }
      OpenBatch open;
      open.number = block.batch_number;
      open.timestamp = block.timestamp;
      open.l1_gas_price = block.l1_gas_price;
      open.l2_fair_gas_price = block.l2_fair_gas_price;
      open.operator_address = block.operator_address;
      open.protocol_version = block.protocol_version;
      open.first_block_number = block.number;
      open.first_block_virtual_blocks = block.virtual_blocks;
      open.prev_block_hash = prev_block_hash_;
      actions.emplace_back(open);
    } else {
      actions.emplace_back(
          Miniblock{block.number, block.timestamp, block.virtual_blocks});
    }

    for (const auto &tx : block.transactions) {
      actions.emplace_back(Tx{tx});
    }

    if (block.last_in_batch) {
      actions.emplace_back(SealBatch{block.virtual_blocks});
    } else {
      actions.emplace_back(SealMiniblock{});
    }

    auto local_hash = computeBlockHash(
        block.number, block.timestamp, prev_block_hash_, block.transactions);
    if (local_hash != block.reference_hash) {
      logger_->warn("hash of block {} is {}, the sealing node reported {}",
                    block.number,
                    local_hash.toHex(),
                    block.reference_hash.toHex());
    }

    next_block_ = block.number + 1;
    prev_block_hash_ = local_hash;
    batch_ = block.batch_number;
    return actions;
  }

}  // namespace qstore::consensus
