#include "primitives/codec.hpp"

#include <limits>

#include "primitives/proto/primitives.pb.h"

namespace qstore::primitives {

  namespace {
    template <typename Message>
    base::Buffer serialize(const Message &message) {
      return base::Buffer::fromString(message.SerializeAsString());
    }

    template <typename Message>
    outcome::result<Message> parse(const base::Buffer &bytes) {
      Message message;
      if (!message.ParseFromArray(bytes.data(),
                                  static_cast<int>(bytes.size()))) {
        return PrimitivesError::DECODE_FAILED;
      }
      return message;
    }

    template <typename BlobT>
    outcome::result<BlobT> blobField(const std::string &field) {
      auto blob = BlobT::fromString(field);
      if (!blob) {
        return PrimitivesError::DECODE_FAILED;
      }
      return blob.value();
    }

    void toProto(const BlockHeader &header, proto::BlockHeader &out) {
      out.set_number(header.number);
      out.set_payload_hash(header.payload_hash.toString());
    }

    outcome::result<BlockHeader> fromProto(const proto::BlockHeader &msg) {
      BlockHeader header;
      header.number = msg.number();
      OUTCOME_TRY((auto &&, hash),
                  blobField<base::Hash256>(msg.payload_hash()));
      header.payload_hash = hash;
      return header;
    }
  }  // namespace

  base::Buffer encodePayload(const Payload &payload) {
    proto::Payload msg;
    msg.set_hash(payload.hash.toString());
    msg.set_batch_number(payload.batch_number);
    msg.set_last_in_batch(payload.last_in_batch);
    msg.set_protocol_version(payload.protocol_version);
    msg.set_timestamp(payload.timestamp);
    msg.set_l1_gas_price(payload.l1_gas_price);
    msg.set_l2_fair_gas_price(payload.l2_fair_gas_price);
    msg.set_virtual_blocks(payload.virtual_blocks);
    msg.set_operator_address(payload.operator_address.toString());
    for (const auto &tx : payload.transactions) {
      auto *out = msg.add_transactions();
      out->set_raw(tx.raw.toString());
      out->set_hash(tx.hash.toString());
    }
    return serialize(msg);
  }

  outcome::result<Payload> decodePayload(const base::Buffer &bytes) {
    OUTCOME_TRY((auto &&, msg), parse<proto::Payload>(bytes));
    if (msg.protocol_version() > std::numeric_limits<uint16_t>::max()) {
      return PrimitivesError::DECODE_FAILED;
    }

    Payload payload;
    OUTCOME_TRY((auto &&, hash), blobField<base::Hash256>(msg.hash()));
    payload.hash = hash;
    payload.batch_number = msg.batch_number();
    payload.last_in_batch = msg.last_in_batch();
    payload.protocol_version = static_cast<uint16_t>(msg.protocol_version());
    payload.timestamp = msg.timestamp();
    payload.l1_gas_price = msg.l1_gas_price();
    payload.l2_fair_gas_price = msg.l2_fair_gas_price();
    payload.virtual_blocks = msg.virtual_blocks();
    OUTCOME_TRY((auto &&, address),
                blobField<Address>(msg.operator_address()));
    payload.operator_address = address;

    payload.transactions.reserve(msg.transactions_size());
    for (const auto &tx : msg.transactions()) {
      OUTCOME_TRY((auto &&, tx_hash), blobField<base::Hash256>(tx.hash()));
      payload.transactions.push_back(
          Transaction{base::Buffer::fromString(tx.raw()), tx_hash});
    }
    return payload;
  }

  base::Buffer encodeHeader(const BlockHeader &header) {
    proto::BlockHeader msg;
    toProto(header, msg);
    return serialize(msg);
  }

  outcome::result<BlockHeader> decodeHeader(const base::Buffer &bytes) {
    OUTCOME_TRY((auto &&, msg), parse<proto::BlockHeader>(bytes));
    return fromProto(msg);
  }

  base::Buffer encodeCommitQC(const CommitQC &qc) {
    proto::CommitQC msg;
    toProto(qc.header, *msg.mutable_header());
    for (const auto &sig : qc.signatures) {
      auto *out = msg.add_signatures();
      out->set_public_key(sig.public_key.toString());
      out->set_signature(sig.signature.toString());
    }
    return serialize(msg);
  }

  outcome::result<CommitQC> decodeCommitQC(const base::Buffer &bytes) {
    OUTCOME_TRY((auto &&, msg), parse<proto::CommitQC>(bytes));
    if (!msg.has_header()) {
      return PrimitivesError::DECODE_FAILED;
    }
    CommitQC qc;
    OUTCOME_TRY((auto &&, header), fromProto(msg.header()));
    qc.header = header;
    for (const auto &sig : msg.signatures()) {
      OUTCOME_TRY((auto &&, key),
                  blobField<crypto::ED25519PublicKey>(sig.public_key()));
      OUTCOME_TRY((auto &&, signature),
                  blobField<crypto::ED25519Signature>(sig.signature()));
      qc.signatures.push_back(ValidatorSignature{key, signature});
    }
    return qc;
  }

}  // namespace qstore::primitives
