#ifndef QSTORE_STORAGE_FACE_WRITEABLE_HPP
#define QSTORE_STORAGE_FACE_WRITEABLE_HPP

#include "outcome/outcome.hpp"

namespace qstore::storage::face {

  /**
   * @brief An mixin for modifiable map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store value by key, overwriting an existing one
     * @param key key
     * @param value value
     * @return result containing void if put successful, error otherwise
     */
    virtual outcome::result<void> put(const K &key, const V &value) = 0;

    /**
     * @brief Store value by key under a uniqueness constraint
     * @return DatabaseError::DUPLICATE_KEY if the key already holds a value
     * visible to this writer or committed concurrently
     */
    virtual outcome::result<void> insert(const K &key, const V &value) = 0;

    /**
     * @brief Remove value by key
     * @param key K
     * @return error code if error happened
     */
    virtual outcome::result<void> remove(const K &key) = 0;
  };

}  // namespace qstore::storage::face

#endif  // QSTORE_STORAGE_FACE_WRITEABLE_HPP
