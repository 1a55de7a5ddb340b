#include "consensus/ctx_storage.hpp"

#include "dal/blocks_dal.hpp"
#include "dal/consensus_dal.hpp"

namespace qstore::consensus {

  using concurrency::Ctx;
  using primitives::BlockNumber;
  using primitives::CommitQC;

  outcome::result<CtxStorage> CtxStorage::access(const Ctx &ctx,
                                                 storage::ConnectionPool &pool) {
    OUTCOME_TRY((auto &&, conn), pool.accessTagged(ctx, kTag));
    auto *raw = conn.get();
    return CtxStorage(std::move(conn), raw, false);
  }

  CtxStorage::CtxStorage(std::unique_ptr<storage::Connection> owned,
                         storage::Connection *conn,
                         bool scoped)
      : owned_{std::move(owned)},
        conn_{conn},
        scoped_{scoped},
        logger_{base::createLogger("CtxStorage")} {}

  CtxStorage::CtxStorage(CtxStorage &&other) noexcept
      : owned_{std::move(other.owned_)},
        conn_{other.conn_},
        scoped_{other.scoped_},
        logger_{std::move(other.logger_)} {
    other.conn_ = nullptr;
    other.scoped_ = false;
  }

  CtxStorage::~CtxStorage() {
    if (scoped_ && conn_ != nullptr) {
      auto res = conn_->rollback();
      if (!res) {
        logger_->error("rollback of an abandoned transaction failed: {}",
                       res.error().message());
      }
    }
  }

  outcome::result<CtxStorage> CtxStorage::startTransaction(const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    BOOST_OUTCOME_TRYV2(auto &&, conn_->begin());
    return CtxStorage(nullptr, conn_, true);
  }

  outcome::result<void> CtxStorage::commit(const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    // the scope is closed whatever commit returns
    scoped_ = false;
    return conn_->commit();
  }

  outcome::result<boost::optional<BlockNumber>> CtxStorage::lastBlockNumber(
      const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    OUTCOME_TRY((auto &&, number), dal::BlocksDal(*conn_).lastSealedBlockNumber());
    if (!number) {
      return boost::none;
    }
    return boost::make_optional<BlockNumber>(*number);
  }

  outcome::result<boost::optional<primitives::Payload>> CtxStorage::payload(
      const Ctx &ctx,
      BlockNumber number,
      const primitives::Address &operator_address) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    OUTCOME_TRY((auto &&, exec_number), primitives::toExecBlockNumber(number));
    return dal::ConsensusDal(*conn_).blockPayload(exec_number, operator_address);
  }

  outcome::result<boost::optional<CommitQC>> CtxStorage::firstCertificate(
      const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).firstCertificate();
  }

  outcome::result<boost::optional<CommitQC>> CtxStorage::lastCertificate(
      const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).lastCertificate();
  }

  outcome::result<boost::optional<CommitQC>> CtxStorage::certificate(
      const Ctx &ctx, BlockNumber number) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).certificate(number);
  }

  outcome::result<void> CtxStorage::insertCertificate(
      const Ctx &ctx,
      const CommitQC &qc,
      const primitives::Address &operator_address) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).insertCertificate(qc, operator_address);
  }

  outcome::result<void> CtxStorage::claimGenesis(const Ctx &ctx,
                                                 BlockNumber number) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).claimGenesis(number);
  }

  outcome::result<boost::optional<primitives::ReplicaState>>
  CtxStorage::replicaState(const Ctx &ctx, const std::string &node_id) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).replicaState(node_id);
  }

  outcome::result<void> CtxStorage::setReplicaState(
      const Ctx &ctx,
      const std::string &node_id,
      const primitives::ReplicaState &state) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return dal::ConsensusDal(*conn_).setReplicaState(node_id, state);
  }

  outcome::result<FetcherCursor> CtxStorage::newFetcherCursor(const Ctx &ctx) {
    BOOST_OUTCOME_TRYV2(auto &&, ctx.check());
    return FetcherCursor::load(*conn_);
  }

}  // namespace qstore::consensus
