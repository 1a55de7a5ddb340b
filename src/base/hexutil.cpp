#include "base/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::base, UnhexError, e) {
  using qstore::base::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::MISSING_0X_PREFIX:
      return "Input is expected to start with 0x";
  }
  return "unknown error";
}

namespace qstore::base {

  namespace {
    constexpr char kHexDigits[] = "0123456789abcdef";

    int fromHexDigit(char c) {
      if (c >= '0' && c <= '9') {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
      }
      if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
      }
      return -1;
    }
  }  // namespace

  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept {
    std::string res;
    res.reserve(bytes.size() * 2);
    for (auto b : bytes) {
      res.push_back(kHexDigits[b >> 4u]);
      res.push_back(kHexDigits[b & 0x0fu]);
    }
    return res;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }

    std::vector<uint8_t> blob;
    blob.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
      auto hi = fromHexDigit(hex[i]);
      auto lo = fromHexDigit(hex[i + 1]);
      if (hi < 0 || lo < 0) {
        return UnhexError::NON_HEX_INPUT;
      }
      blob.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return blob;
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex) {
    constexpr std::string_view kPrefix = "0x";
    if (hex.substr(0, kPrefix.size()) != kPrefix) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex.substr(kPrefix.size()));
  }

}  // namespace qstore::base
