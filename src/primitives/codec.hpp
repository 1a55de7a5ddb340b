#ifndef QSTORE_PRIMITIVES_CODEC_HPP
#define QSTORE_PRIMITIVES_CODEC_HPP

#include "primitives/block.hpp"
#include "primitives/payload.hpp"

namespace qstore::primitives {

  /**
   * Protobuf encodings of the consensus wire types. Decoding fails with
   * PrimitivesError::DECODE_FAILED on malformed input or on byte fields of
   * the wrong length.
   */

  base::Buffer encodePayload(const Payload &payload);
  outcome::result<Payload> decodePayload(const base::Buffer &bytes);

  base::Buffer encodeHeader(const BlockHeader &header);
  outcome::result<BlockHeader> decodeHeader(const base::Buffer &bytes);

  base::Buffer encodeCommitQC(const CommitQC &qc);
  outcome::result<CommitQC> decodeCommitQC(const base::Buffer &bytes);

}  // namespace qstore::primitives

#endif  // QSTORE_PRIMITIVES_CODEC_HPP
