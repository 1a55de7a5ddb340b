#include "storage/rocksdb/rocksdb_log_database.hpp"

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include "storage/rocksdb/rocksdb_transaction.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace qstore::storage
{
    using BlockBasedTableOptions = ::ROCKSDB_NAMESPACE::BlockBasedTableOptions;

    outcome::result<std::shared_ptr<RocksLogDatabase>> RocksLogDatabase::create( std::string_view path,
                                                                                 Options          options )
    {
        std::shared_ptr<RocksLogDatabase> l( new RocksLogDatabase() );
        l->logger_ = base::createLogger( "rocksdb" );

        // Set up bloom filter for point lookups of certificates and blocks
        BlockBasedTableOptions table_options;
        table_options.filter_policy.reset( ::ROCKSDB_NAMESPACE::NewBloomFilterPolicy( 10, false ) );
        table_options.whole_key_filtering = true;
        options.table_factory.reset( ::ROCKSDB_NAMESPACE::NewBlockBasedTableFactory( table_options ) );
        options.info_log_level = ::ROCKSDB_NAMESPACE::InfoLogLevel::ERROR_LEVEL;

        TransactionDBOptions txn_db_options;
        txn_db_options.transaction_lock_timeout = kLockTimeoutMs;

        TransactionDB *db     = nullptr;
        auto           status = TransactionDB::Open( options, txn_db_options, std::string( path ), &db );
        if ( !status.ok() )
        {
            return error_as_result<std::shared_ptr<RocksLogDatabase>>( status, l->logger_ );
        }
        l->db_.reset( db );

        WriteOptions write_options;
        write_options.sync = true;
        l->setWriteOptions( write_options );
        return l;
    }

    std::unique_ptr<LogTransaction> RocksLogDatabase::begin()
    {
        ::ROCKSDB_NAMESPACE::TransactionOptions txn_options;
        txn_options.lock_timeout = kLockTimeoutMs;
        std::unique_ptr<::ROCKSDB_NAMESPACE::Transaction> txn( db_->BeginTransaction( wo_, txn_options ) );
        return std::make_unique<Transaction>( shared_from_this(), std::move( txn ) );
    }

    void RocksLogDatabase::setWriteOptions( WriteOptions wo )
    {
        wo_ = wo;
    }

} // namespace qstore::storage
