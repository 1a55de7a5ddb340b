#include "consensus/store.hpp"

#include <sstream>
#include <string>

#include "consensus/genesis.hpp"
#include "consensus/store_error.hpp"
#include "crypto/sha/sha256.hpp"
#include "primitives/codec.hpp"
#include "storage/database_error.hpp"

namespace qstore::consensus {

  using concurrency::Ctx;
  using primitives::BlockNumber;
  using primitives::FinalBlock;

  Store::Store(std::shared_ptr<storage::ConnectionPool> pool,
               std::shared_ptr<crypto::ED25519Provider> crypto_provider,
               StoreConfig config)
      : pool_{std::move(pool)},
        crypto_provider_{std::move(crypto_provider)},
        config_{std::move(config)},
        logger_{base::createLogger("ConsensusStore")} {}

  outcome::result<CtxStorage> Store::access(const Ctx &ctx) {
    return CtxStorage::access(ctx, *pool_);
  }

  outcome::result<void> Store::tryInitGenesis(
      const Ctx &ctx,
      const std::vector<crypto::ED25519Keypair> &validator_keys) {
    OUTCOME_TRY((auto &&, conn), access(ctx));

    // read outside of the transaction, sealing goes on concurrently
    OUTCOME_TRY((auto &&, last_block), conn.lastBlockNumber(ctx));
    if (!last_block) {
      logger_->error("try_init_genesis(): execution log is empty");
      return StoreError::NO_SEALED_BLOCK;
    }
    auto number = *last_block;

    auto attempt = [&]() -> outcome::result<void> {
      OUTCOME_TRY((auto &&, txn), conn.startTransaction(ctx));
      OUTCOME_TRY((auto &&, first), txn.firstCertificate(ctx));
      if (first) {
        return outcome::success();
      }
      OUTCOME_TRY((auto &&, payload),
                  txn.payload(ctx, number, config_.operator_address));
      if (!payload) {
        logger_->critical(
            "try_init_genesis(): payload of block {} disappeared", number);
        return StoreError::BLOCK_DISAPPEARED;
      }
      OUTCOME_TRY(
          (auto &&, qc),
          makeGenesis(*crypto_provider_, validator_keys, *payload, number));
      // bootstraps that read different sealed blocks collide on the claim
      BOOST_OUTCOME_TRYV2(auto &&, txn.claimGenesis(ctx, number));
      BOOST_OUTCOME_TRYV2(
          auto &&, txn.insertCertificate(ctx, qc, config_.operator_address));
      return txn.commit(ctx);
    };

    auto res = attempt();
    if (res) {
      return outcome::success();
    }
    if (res.error() == storage::DatabaseError::DUPLICATE_KEY
        || res.error() == storage::DatabaseError::CONFLICT) {
      // a concurrent bootstrap may have won
      OUTCOME_TRY((auto &&, first), conn.firstCertificate(ctx));
      if (first) {
        logger_->info("try_init_genesis(): genesis created concurrently");
        return outcome::success();
      }
    }
    logger_->error("try_init_genesis() for block {} failed: {}",
                   number,
                   res.error().message());
    return res.error();
  }

  outcome::result<void> Store::setActionsQueue(const Ctx &ctx,
                                               ActionQueueSender sender) {
    OUTCOME_TRY((auto &&, conn), access(ctx));
    auto cursor = conn.newFetcherCursor(ctx);
    if (!cursor) {
      logger_->error("set_actions_queue(): new_fetcher_cursor() failed: {}",
                     cursor.error().message());
      return cursor.error();
    }
    std::lock_guard<std::mutex> lock(follower_mutex_);
    follower_.emplace(Follower{std::move(cursor.value()), std::move(sender)});
    logger_->info("forwarding certified blocks from block {}",
                  follower_->cursor.nextBlock());
    return outcome::success();
  }

  outcome::result<boost::optional<primitives::BlockStoreState>> Store::state(
      const Ctx &ctx) {
    OUTCOME_TRY((auto &&, conn), access(ctx));
    OUTCOME_TRY((auto &&, first), conn.firstCertificate(ctx));
    if (!first) {
      return boost::none;
    }
    OUTCOME_TRY((auto &&, last), conn.lastCertificate(ctx));
    if (!last) {
      logger_->critical("state(): first certificate {} exists but no last one",
                        first->number());
      return StoreError::GENESIS_DISAPPEARED;
    }
    return boost::make_optional(
        primitives::BlockStoreState{std::move(*first), std::move(*last)});
  }

  outcome::result<boost::optional<FinalBlock>> Store::block(
      const Ctx &ctx, BlockNumber number) {
    OUTCOME_TRY((auto &&, conn), access(ctx));
    OUTCOME_TRY((auto &&, justification), conn.certificate(ctx, number));
    if (!justification) {
      return boost::none;
    }
    OUTCOME_TRY((auto &&, payload),
                conn.payload(ctx, number, config_.operator_address));
    if (!payload) {
      logger_->critical("block(): block {} is certified but not sealed",
                        number);
      return StoreError::BLOCK_DISAPPEARED;
    }
    return boost::make_optional(FinalBlock{primitives::encodePayload(*payload),
                                           std::move(*justification)});
  }

  outcome::result<void> Store::forwardBlock(const Ctx &ctx,
                                            const FinalBlock &block) {
    boost::optional<ActionQueueSender> sender;
    boost::optional<FetcherCursor> previous;
    std::vector<SyncAction> actions;
    {
      std::lock_guard<std::mutex> lock(follower_mutex_);
      if (!follower_) {
        return outcome::success();
      }
      auto number = primitives::toExecBlockNumber(block.number());
      if (!number) {
        logger_->error("store_next_block(): block {} is out of range",
                       block.number());
        return number.error();
      }
      if (number.value() < follower_->cursor.nextBlock()) {
        return outcome::success();
      }
      auto payload = primitives::decodePayload(block.payload);
      if (!payload) {
        logger_->error("store_next_block(): payload of block {} is malformed",
                       block.number());
        return StoreError::PAYLOAD_DECODE_FAILED;
      }
      previous = follower_->cursor;
      auto advanced = follower_->cursor.advance(
          FetchedBlock::fromPayload(number.value(), payload.value()));
      if (!advanced) {
        logger_->error("store_next_block(): advance() failed for block {}: {}",
                       block.number(),
                       advanced.error().message());
        return advanced.error();
      }
      actions = std::move(advanced.value());
      sender = follower_->sender;
    }
    auto pushed = sender->pushActions(ctx, std::move(actions));
    if (!pushed) {
      logger_->warn("store_next_block(): push_actions() failed for block {}: {}",
                    block.number(),
                    pushed.error().message());
      std::lock_guard<std::mutex> lock(follower_mutex_);
      // rewind so that a retry forwards the block again, unless a later
      // block went through meanwhile
      if (follower_->cursor.nextBlock() == previous->nextBlock() + 1) {
        follower_->cursor = std::move(*previous);
      }
    }
    return pushed;
  }

  outcome::result<void> Store::waitUntilSealed(const Ctx &ctx,
                                               BlockNumber number) {
    while (true) {
      {
        OUTCOME_TRY((auto &&, conn), access(ctx));
        OUTCOME_TRY((auto &&, last), conn.lastBlockNumber(ctx));
        if (last && *last >= number) {
          return outcome::success();
        }
      }
      BOOST_OUTCOME_TRYV2(auto &&, ctx.sleep(config_.poll_interval));
    }
  }

  outcome::result<void> Store::insertNextCertificate(
      const Ctx &ctx, CtxStorage &conn, const primitives::CommitQC &qc) {
    auto number = qc.number();
    OUTCOME_TRY((auto &&, txn), conn.startTransaction(ctx));
    OUTCOME_TRY((auto &&, last), txn.lastCertificate(ctx));
    if (last && number <= last->number()) {
      OUTCOME_TRY((auto &&, stored), txn.certificate(ctx, number));
      if (!stored) {
        logger_->warn("store_next_block(): block {} precedes genesis", number);
        return StoreError::NOT_NEXT_BLOCK;
      }
      if (*stored == qc) {
        return outcome::success();
      }
      return storage::DatabaseError::DUPLICATE_KEY;
    }
    if (!last || number != last->number() + 1) {
      logger_->warn("store_next_block(): block {} does not follow block {}",
                    number,
                    last ? std::to_string(last->number()) : "none");
      return StoreError::NOT_NEXT_BLOCK;
    }
    BOOST_OUTCOME_TRYV2(
        auto &&, txn.insertCertificate(ctx, qc, config_.operator_address));
    return txn.commit(ctx);
  }

  outcome::result<void> Store::storeNextBlock(const Ctx &ctx,
                                              const FinalBlock &block) {
    auto number = block.number();
    auto payload_hash = crypto::sha256(block.payload.toVector());
    if (payload_hash != block.header().payload_hash) {
      logger_->error("store_next_block(): certificate of block {} does not "
                     "match its payload",
                     number);
      return StoreError::CERTIFICATE_MISMATCH;
    }

    BOOST_OUTCOME_TRYV2(auto &&, forwardBlock(ctx, block));

    auto sealed = waitUntilSealed(ctx, number);
    if (!sealed) {
      logger_->warn("store_next_block(): waiting for block {} aborted: {}",
                    number,
                    sealed.error().message());
      return sealed.error();
    }

    OUTCOME_TRY((auto &&, conn), access(ctx));
    auto inserted = insertNextCertificate(ctx, conn, block.justification);
    if (!inserted
        && (inserted.error() == storage::DatabaseError::DUPLICATE_KEY
            || inserted.error() == storage::DatabaseError::CONFLICT)) {
      // a concurrent call may have stored the very same certificate
      OUTCOME_TRY((auto &&, stored), conn.certificate(ctx, number));
      if (stored && *stored == block.justification) {
        return outcome::success();
      }
    }
    if (!inserted) {
      logger_->error("store_next_block(): insert_certificate() failed for "
                     "block {}: {}",
                     number,
                     inserted.error().message());
      return inserted.error();
    }
    return outcome::success();
  }

  outcome::result<boost::optional<primitives::ReplicaState>>
  Store::replicaState(const Ctx &ctx) {
    OUTCOME_TRY((auto &&, conn), access(ctx));
    return conn.replicaState(ctx, config_.node_id);
  }

  outcome::result<void> Store::setReplicaState(
      const Ctx &ctx, const primitives::ReplicaState &state) {
    OUTCOME_TRY((auto &&, conn), access(ctx));
    return conn.setReplicaState(ctx, config_.node_id, state);
  }

  outcome::result<base::Buffer> Store::propose(const Ctx &ctx,
                                               BlockNumber number) {
    {
      OUTCOME_TRY((auto &&, conn), access(ctx));
      boost::optional<primitives::CommitQC> parent;
      if (number > 0) {
        OUTCOME_TRY((auto &&, qc), conn.certificate(ctx, number - 1));
        parent = std::move(qc);
      }
      if (!parent) {
        logger_->warn("propose(): certificate of the parent of block {} is "
                      "missing",
                      number);
        return StoreError::MISSING_PARENT;
      }
    }

    while (true) {
      {
        OUTCOME_TRY((auto &&, conn), access(ctx));
        OUTCOME_TRY((auto &&, payload),
                    conn.payload(ctx, number, config_.operator_address));
        if (payload) {
          return primitives::encodePayload(*payload);
        }
      }
      BOOST_OUTCOME_TRYV2(auto &&, ctx.sleep(config_.poll_interval));
    }
  }

  outcome::result<void> Store::verify(const Ctx &ctx,
                                      BlockNumber number,
                                      const base::Buffer &payload) {
    OUTCOME_TRY((auto &&, want_bytes), propose(ctx, number));
    auto want = primitives::decodePayload(want_bytes);
    auto got = primitives::decodePayload(payload);
    if (!want || !got) {
      logger_->warn("verify(): payload of block {} is malformed", number);
      return StoreError::PAYLOAD_DECODE_FAILED;
    }
    if (want.value() != got.value()) {
      std::ostringstream want_str;
      std::ostringstream got_str;
      want_str << want.value();
      got_str << got.value();
      logger_->warn("verify(): block {} payload mismatch, want {}, got {}",
                    number,
                    want_str.str(),
                    got_str.str());
      return StoreError::PAYLOAD_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace qstore::consensus
