#ifndef QSTORE_STORAGE_FACE_TRANSACTION_HPP
#define QSTORE_STORAGE_FACE_TRANSACTION_HPP

#include "storage/face/ordered.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace qstore::storage::face {

  /**
   * @brief An atomic unit of work over an ordered map. Reads observe the
   * writes of the same transaction; other transactions see them only after
   * commit(). Destroying an unfinished transaction rolls it back.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Transaction : public Readable<K, V>,
                       public Writeable<K, V>,
                       public Ordered<K, V> {
    /**
     * @brief Mark a point to which the transaction may later roll back.
     * Save points nest.
     */
    virtual void setSavePoint() = 0;

    /**
     * @brief Undo all writes since the most recent save point and drop it
     */
    virtual outcome::result<void> rollbackToSavePoint() = 0;

    /**
     * @brief Drop the most recent save point keeping its writes
     */
    virtual outcome::result<void> popSavePoint() = 0;

    /**
     * @brief Make all writes durable and visible atomically
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Discard all writes
     */
    virtual void rollback() = 0;
  };

}  // namespace qstore::storage::face

#endif  // QSTORE_STORAGE_FACE_TRANSACTION_HPP
