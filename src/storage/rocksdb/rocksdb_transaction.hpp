#ifndef QSTORE_STORAGE_ROCKSDB_TRANSACTION_HPP
#define QSTORE_STORAGE_ROCKSDB_TRANSACTION_HPP

#include <rocksdb/utilities/transaction.h>

#include "storage/rocksdb/rocksdb_log_database.hpp"

namespace qstore::storage
{

    /**
     * @brief Transaction of RocksLogDatabase. Keeps the database alive until
     * it is finished.
     */
    class RocksLogDatabase::Transaction : public LogTransaction
    {
    public:
        Transaction( std::shared_ptr<RocksLogDatabase> db, std::unique_ptr<::ROCKSDB_NAMESPACE::Transaction> txn );
        ~Transaction() override;

        outcome::result<Buffer> get( const Buffer &key ) const override;

        outcome::result<void> put( const Buffer &key, const Buffer &value ) override;

        outcome::result<void> insert( const Buffer &key, const Buffer &value ) override;

        outcome::result<void> remove( const Buffer &key ) override;

        outcome::result<boost::optional<LogEntry>> first( const Buffer &prefix ) const override;

        outcome::result<boost::optional<LogEntry>> last( const Buffer &prefix ) const override;

        void setSavePoint() override;

        outcome::result<void> rollbackToSavePoint() override;

        outcome::result<void> popSavePoint() override;

        outcome::result<void> commit() override;

        void rollback() override;

    private:
        std::shared_ptr<RocksLogDatabase>                 db_;
        std::unique_ptr<::ROCKSDB_NAMESPACE::Transaction> txn_;
    };

} // namespace qstore::storage

#endif // QSTORE_STORAGE_ROCKSDB_TRANSACTION_HPP
