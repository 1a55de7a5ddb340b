#ifndef QSTORE_STORAGE_FACE_ORDERED_HPP
#define QSTORE_STORAGE_FACE_ORDERED_HPP

#include <utility>

#include <boost/optional.hpp>
#include "outcome/outcome.hpp"

namespace qstore::storage::face {

  /**
   * @brief A mixin for a map ordered by key, giving access to the bounds of
   * a key range sharing a prefix.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Ordered {
    using Entry = std::pair<K, V>;

    virtual ~Ordered() = default;

    /**
     * @return entry with the smallest key starting with prefix, none if the
     * range is empty
     */
    virtual outcome::result<boost::optional<Entry>> first(
        const K &prefix) const = 0;

    /**
     * @return entry with the largest key starting with prefix, none if the
     * range is empty
     */
    virtual outcome::result<boost::optional<Entry>> last(
        const K &prefix) const = 0;
  };

}  // namespace qstore::storage::face

#endif  // QSTORE_STORAGE_FACE_ORDERED_HPP
