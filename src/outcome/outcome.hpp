#ifndef QSTORE_OUTCOME_HPP
#define QSTORE_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::result;
  using libp2p::outcome::success;
  using libp2p::outcome::failure;
}

#endif  // QSTORE_OUTCOME_HPP
