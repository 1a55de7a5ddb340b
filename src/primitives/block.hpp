#ifndef QSTORE_PRIMITIVES_BLOCK_HPP
#define QSTORE_PRIMITIVES_BLOCK_HPP

#include <vector>

#include "base/buffer.hpp"
#include "crypto/ed25519_types.hpp"
#include "primitives/common.hpp"

namespace qstore::primitives {

  /**
   * What validators sign: the block number and the hash of its encoded
   * payload
   */
  struct BlockHeader {
    BlockNumber number = 0;
    base::Hash256 payload_hash;

    bool operator==(const BlockHeader &other) const {
      return number == other.number && payload_hash == other.payload_hash;
    }
    bool operator!=(const BlockHeader &other) const {
      return !(*this == other);
    }
  };

  struct ValidatorSignature {
    crypto::ED25519PublicKey public_key;
    crypto::ED25519Signature signature;

    bool operator==(const ValidatorSignature &other) const {
      return public_key == other.public_key && signature == other.signature;
    }
    bool operator!=(const ValidatorSignature &other) const {
      return !(*this == other);
    }
  };

  /// Quorum certificate, kept opaque apart from the header it attests
  struct CommitQC {
    BlockHeader header;
    std::vector<ValidatorSignature> signatures;

    BlockNumber number() const {
      return header.number;
    }

    bool operator==(const CommitQC &other) const {
      return header == other.header && signatures == other.signatures;
    }
    bool operator!=(const CommitQC &other) const {
      return !(*this == other);
    }
  };

  /// Certified block: encoded payload with its certificate
  struct FinalBlock {
    base::Buffer payload;
    CommitQC justification;

    BlockNumber number() const {
      return justification.number();
    }

    const BlockHeader &header() const {
      return justification.header;
    }
  };

  /// Certified range of the chain; both ends are inclusive
  struct BlockStoreState {
    CommitQC first_qc;
    CommitQC last_qc;

    BlockNumber first() const {
      return first_qc.number();
    }
    BlockNumber last() const {
      return last_qc.number();
    }
  };

  /// Opaque voting state of one replica
  using ReplicaState = base::Buffer;

}  // namespace qstore::primitives

#endif  // QSTORE_PRIMITIVES_BLOCK_HPP
