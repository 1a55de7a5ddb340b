#ifndef QSTORE_TEST_TESTUTIL_LITERALS_HPP_
#define QSTORE_TEST_TESTUTIL_LITERALS_HPP_

#include <algorithm>

#include "base/blob.hpp"
#include "base/buffer.hpp"
#include "base/hexutil.hpp"

/// creates a buffer filled with characters from the original string
/// mind that it does not perform unhexing, there is ""_unhex for it
inline qstore::base::Buffer operator"" _buf(const char *c, size_t s) {
  std::vector<uint8_t> chars(c, c + s);
  return qstore::base::Buffer(std::move(chars));
}

inline qstore::base::Hash256 operator"" _hash256(const char *c, size_t s) {
  qstore::base::Hash256 hash{};
  std::copy_n(c, std::min<size_t>(s, 32ul), hash.rbegin());
  return hash;
}

inline qstore::base::Buffer operator"" _hex2buf(const char *c, size_t s) {
  return qstore::base::Buffer::fromHex(std::string_view(c, s)).value();
}

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return qstore::base::unhex(std::string_view(c, s)).value();
}

#endif  // QSTORE_TEST_TESTUTIL_LITERALS_HPP_
