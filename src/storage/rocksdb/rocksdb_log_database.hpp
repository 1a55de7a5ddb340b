#ifndef QSTORE_STORAGE_ROCKSDB_LOG_DATABASE_HPP
#define QSTORE_STORAGE_ROCKSDB_LOG_DATABASE_HPP

#include <rocksdb/rocksdb_namespace.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction_db.h>

#include "base/logger.hpp"
#include "storage/log_types.hpp"

namespace qstore::storage
{

    /**
     * @brief An implementation of LogDatabase on a pessimistic rocksdb
     * TransactionDB. Reads go to the latest committed state, so transactions
     * run at read committed isolation; inserts lock their key.
     */
    class RocksLogDatabase : public LogDatabase,
                             public std::enable_shared_from_this<RocksLogDatabase>
    {
    public:
        class Transaction;

        using Options              = ::ROCKSDB_NAMESPACE::Options;
        using TransactionDBOptions = ::ROCKSDB_NAMESPACE::TransactionDBOptions;
        using ReadOptions          = ::ROCKSDB_NAMESPACE::ReadOptions;
        using WriteOptions         = ::ROCKSDB_NAMESPACE::WriteOptions;
        using TransactionDB        = ::ROCKSDB_NAMESPACE::TransactionDB;
        using Status               = ::ROCKSDB_NAMESPACE::Status;

        /// Lock wait before an insert gives up with CONFLICT
        static constexpr int64_t kLockTimeoutMs = 1000;

        ~RocksLogDatabase() override = default;

        /**
         * @brief Factory method to open or create a database.
         * @param path filesystem path where database is going to be
         * @param options rocksdb options, such as caching, logging, etc.
         * @return instance of RocksLogDatabase
         */
        static outcome::result<std::shared_ptr<RocksLogDatabase>> create( std::string_view path,
                                                                          Options          options = Options() );

        std::unique_ptr<LogTransaction> begin() override;

        /**
         * @brief Set write options, which are used on every commit
         * @param wo options
         */
        void setWriteOptions( WriteOptions wo );

        std::string GetName() override
        {
            return "RocksLogDatabase";
        }

    private:
        RocksLogDatabase() = default;

        std::unique_ptr<TransactionDB> db_;
        ReadOptions                    ro_;
        WriteOptions                   wo_;
        base::Logger                   logger_;
    };

} // namespace qstore::storage

#endif // QSTORE_STORAGE_ROCKSDB_LOG_DATABASE_HPP
