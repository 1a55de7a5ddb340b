#ifndef QSTORE_STORAGE_FACE_TRANSACTIONAL_STORAGE_HPP
#define QSTORE_STORAGE_FACE_TRANSACTIONAL_STORAGE_HPP

#include <memory>

#include "base/component.hpp"
#include "storage/face/transaction.hpp"

namespace qstore::storage::face {

  /**
   * @brief An abstraction over a durable ordered key-value storage where all
   * access goes through transactions
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct TransactionalStorage : public base::Component {
    /**
     * @brief Start a new transaction
     */
    virtual std::unique_ptr<Transaction<K, V>> begin() = 0;
  };

}  // namespace qstore::storage::face

#endif  // QSTORE_STORAGE_FACE_TRANSACTIONAL_STORAGE_HPP
