#include "storage/rocksdb/rocksdb_transaction.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace qstore::storage
{
    namespace
    {
        /// Smallest key greater than every key starting with prefix, empty if
        /// there is none
        std::string prefixSuccessor( std::string prefix )
        {
            while ( !prefix.empty() && static_cast<uint8_t>( prefix.back() ) == 0xff )
            {
                prefix.pop_back();
            }
            if ( !prefix.empty() )
            {
                prefix.back() = static_cast<char>( static_cast<uint8_t>( prefix.back() ) + 1 );
            }
            return prefix;
        }
    } // namespace

    RocksLogDatabase::Transaction::Transaction( std::shared_ptr<RocksLogDatabase>                 db,
                                                std::unique_ptr<::ROCKSDB_NAMESPACE::Transaction> txn ) :
        db_( std::move( db ) ), txn_( std::move( txn ) )
    {
    }

    RocksLogDatabase::Transaction::~Transaction()
    {
        rollback();
    }

    outcome::result<Buffer> RocksLogDatabase::Transaction::get( const Buffer &key ) const
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        std::string value;
        auto        status = txn_->Get( db_->ro_, make_slice( key ), &value );
        if ( status.ok() )
        {
            return Buffer::fromString( value );
        }

        // not always an actual error so don't log it
        if ( status.IsNotFound() )
        {
            return error_as_result<Buffer>( status );
        }

        return error_as_result<Buffer>( status, db_->logger_ );
    }

    outcome::result<void> RocksLogDatabase::Transaction::put( const Buffer &key, const Buffer &value )
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto status = txn_->Put( make_slice( key ), make_slice( value ) );
        if ( status.ok() )
        {
            return outcome::success();
        }
        return error_as_result<void>( status, db_->logger_ );
    }

    outcome::result<void> RocksLogDatabase::Transaction::insert( const Buffer &key, const Buffer &value )
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        // locks the key until commit, so a concurrent insert either waits for
        // us and sees the row or times out
        std::string existing;
        auto        status = txn_->GetForUpdate( db_->ro_, make_slice( key ), &existing );
        if ( status.ok() )
        {
            return DatabaseError::DUPLICATE_KEY;
        }
        if ( !status.IsNotFound() )
        {
            return error_as_result<void>( status );
        }
        return put( key, value );
    }

    outcome::result<void> RocksLogDatabase::Transaction::remove( const Buffer &key )
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto status = txn_->Delete( make_slice( key ) );
        if ( status.ok() )
        {
            return outcome::success();
        }
        return error_as_result<void>( status, db_->logger_ );
    }

    outcome::result<boost::optional<LogEntry>> RocksLogDatabase::Transaction::first( const Buffer &prefix ) const
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto slice_prefix = make_slice( prefix );
        auto iter         = std::unique_ptr<::ROCKSDB_NAMESPACE::Iterator>( txn_->GetIterator( db_->ro_ ) );
        iter->Seek( slice_prefix );
        if ( !iter->status().ok() )
        {
            return error_as_result<boost::optional<LogEntry>>( iter->status(), db_->logger_ );
        }
        if ( !iter->Valid() || !iter->key().starts_with( slice_prefix ) )
        {
            return boost::none;
        }
        return boost::optional<LogEntry>{ LogEntry{ make_buffer( iter->key() ), make_buffer( iter->value() ) } };
    }

    outcome::result<boost::optional<LogEntry>> RocksLogDatabase::Transaction::last( const Buffer &prefix ) const
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto slice_prefix = make_slice( prefix );
        auto upper        = prefixSuccessor( prefix.toString() );
        auto iter         = std::unique_ptr<::ROCKSDB_NAMESPACE::Iterator>( txn_->GetIterator( db_->ro_ ) );
        if ( upper.empty() )
        {
            iter->SeekToLast();
        }
        else
        {
            iter->SeekForPrev( upper );
            // SeekForPrev lands on the successor itself if it exists
            if ( iter->Valid() && iter->key().compare( upper ) >= 0 )
            {
                iter->Prev();
            }
        }
        if ( !iter->status().ok() )
        {
            return error_as_result<boost::optional<LogEntry>>( iter->status(), db_->logger_ );
        }
        if ( !iter->Valid() || !iter->key().starts_with( slice_prefix ) )
        {
            return boost::none;
        }
        return boost::optional<LogEntry>{ LogEntry{ make_buffer( iter->key() ), make_buffer( iter->value() ) } };
    }

    void RocksLogDatabase::Transaction::setSavePoint()
    {
        if ( txn_ )
        {
            txn_->SetSavePoint();
        }
    }

    outcome::result<void> RocksLogDatabase::Transaction::rollbackToSavePoint()
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto status = txn_->RollbackToSavePoint();
        if ( status.ok() )
        {
            return outcome::success();
        }
        if ( status.IsNotFound() )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        return error_as_result<void>( status, db_->logger_ );
    }

    outcome::result<void> RocksLogDatabase::Transaction::popSavePoint()
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto status = txn_->PopSavePoint();
        if ( status.ok() )
        {
            return outcome::success();
        }
        if ( status.IsNotFound() )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        return error_as_result<void>( status, db_->logger_ );
    }

    outcome::result<void> RocksLogDatabase::Transaction::commit()
    {
        if ( !txn_ )
        {
            return DatabaseError::NO_TRANSACTION;
        }
        auto status = txn_->Commit();
        txn_.reset();
        if ( status.ok() )
        {
            return outcome::success();
        }
        return error_as_result<void>( status, db_->logger_ );
    }

    void RocksLogDatabase::Transaction::rollback()
    {
        if ( !txn_ )
        {
            return;
        }
        auto status = txn_->Rollback();
        if ( !status.ok() )
        {
            db_->logger_->warn( "rollback failed: {}", status.ToString() );
        }
        txn_.reset();
    }

} // namespace qstore::storage
