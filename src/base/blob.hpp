#ifndef QSTORE_BASE_BLOB_HPP
#define QSTORE_BASE_BLOB_HPP

#include <array>
#include <cstddef>
#include <ostream>

#include <boost/functional/hash.hpp>
#include "base/hexutil.hpp"

namespace qstore::base {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Base type which represents blob of fixed size.
   *
   * Hashes, addresses and keys are all fixed-size byte strings, so they are
   * kept in std::array rather than in a growable container.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    Blob() {
      this->fill(0);
    }

    /**
     * @brief constructor enabling initializer list
     * @param l initializer list
     */
    explicit constexpr Blob(const std::array<byte_t, size_> &l) {
      std::copy(l.begin(), l.end(), this->begin());
    }

    /**
     * In compile-time returns size of current blob.
     */
    constexpr static size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    [[nodiscard]] std::string toHex() const noexcept {
      return hex_lower(gsl::make_span(*this));
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY((auto &&, res), unhex(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from hex string prefixed with 0x
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY((auto &&, res), unhexWith0x(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from span of uint8_t
     * @param span source bytes, must be exactly size_ long
     */
    static outcome::result<Blob<size_>> fromSpan(
        gsl::span<const uint8_t> span) {
      if (static_cast<size_t>(span.size()) != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create Blob from raw bytes kept in a string, e.g. a protobuf bytes field
     */
    static outcome::result<Blob<size_>> fromString(std::string_view data) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      const auto *ptr = reinterpret_cast<const uint8_t *>(data.data());
      return fromSpan(gsl::make_span(ptr, data.size()));
    }

    [[nodiscard]] std::string toString() const {
      return std::string{this->begin(), this->end()};
    }
  };

  extern template class Blob<20ul>;
  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace qstore::base

namespace std {
  template <size_t N>
  struct hash<qstore::base::Blob<N>> {
    auto operator()(const qstore::base::Blob<N> &blob) const {
      return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
    }
  };
}  // namespace std

OUTCOME_HPP_DECLARE_ERROR_2(qstore::base, BlobError);

#endif  // QSTORE_BASE_BLOB_HPP
