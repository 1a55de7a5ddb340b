#ifndef QSTORE_STORAGE_FACE_READABLE_HPP
#define QSTORE_STORAGE_FACE_READABLE_HPP

#include "outcome/outcome.hpp"

namespace qstore::storage::face {

  /**
   * @brief A mixin for readable map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Get value by key
     * @param key K
     * @return V, or DatabaseError::NOT_FOUND if the key is absent
     */
    virtual outcome::result<V> get(const K &key) const = 0;
  };

}  // namespace qstore::storage::face

#endif  // QSTORE_STORAGE_FACE_READABLE_HPP
