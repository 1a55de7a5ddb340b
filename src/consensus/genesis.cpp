#include "consensus/genesis.hpp"

#include "crypto/sha/sha256.hpp"
#include "primitives/codec.hpp"

namespace qstore::consensus {

  outcome::result<primitives::CommitQC> makeGenesis(
      const crypto::ED25519Provider &provider,
      const std::vector<crypto::ED25519Keypair> &validator_keys,
      const primitives::Payload &payload,
      primitives::BlockNumber number) {
    primitives::CommitQC qc;
    qc.header.number = number;
    qc.header.payload_hash =
        crypto::sha256(primitives::encodePayload(payload).toVector());

    auto message = primitives::encodeHeader(qc.header);
    for (const auto &keypair : validator_keys) {
      OUTCOME_TRY((auto &&, signature),
                  provider.sign(keypair, message.toVector()));
      qc.signatures.push_back(
          primitives::ValidatorSignature{keypair.public_key, signature});
    }
    return qc;
  }

}  // namespace qstore::consensus
