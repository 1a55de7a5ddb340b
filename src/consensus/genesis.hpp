#ifndef QSTORE_CONSENSUS_GENESIS_HPP
#define QSTORE_CONSENSUS_GENESIS_HPP

#include <vector>

#include "crypto/ed25519_provider.hpp"
#include "primitives/block.hpp"
#include "primitives/payload.hpp"

namespace qstore::consensus {

  /**
   * Build the certificate of the first block: a header over the encoded
   * payload signed by every validator
   */
  outcome::result<primitives::CommitQC> makeGenesis(
      const crypto::ED25519Provider &provider,
      const std::vector<crypto::ED25519Keypair> &validator_keys,
      const primitives::Payload &payload,
      primitives::BlockNumber number);

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_GENESIS_HPP
