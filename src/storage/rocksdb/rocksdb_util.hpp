#ifndef QSTORE_STORAGE_ROCKSDB_UTIL_HPP
#define QSTORE_STORAGE_ROCKSDB_UTIL_HPP

#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <gsl/span>

#include "outcome/outcome.hpp"
#include "base/buffer.hpp"
#include "base/logger.hpp"
#include "storage/database_error.hpp"

namespace qstore::storage
{

    inline DatabaseError status_as_error( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        if ( s.ok() )
        {
            return DatabaseError::OK;
        }
        if ( s.IsNotFound() )
        {
            return DatabaseError::NOT_FOUND;
        }
        // lock wait or write conflict with another transaction
        if ( s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsExpired() )
        {
            return DatabaseError::CONFLICT;
        }
        if ( s.IsIOError() )
        {
            return DatabaseError::IO_ERROR;
        }
        if ( s.IsInvalidArgument() )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }
        if ( s.IsCorruption() )
        {
            return DatabaseError::CORRUPTION;
        }
        if ( s.IsNotSupported() )
        {
            return DatabaseError::NOT_SUPPORTED;
        }
        return DatabaseError::UNKNOWN;
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        return status_as_error( s );
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s, const base::Logger &logger )
    {
        logger->error( s.ToString() );
        return error_as_result<T>( s );
    }

    inline ::ROCKSDB_NAMESPACE::Slice make_slice( const base::Buffer &buf )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *ptr = reinterpret_cast<const char *>( buf.data() );
        return ::ROCKSDB_NAMESPACE::Slice{ ptr, buf.size() };
    }

    inline gsl::span<const uint8_t> make_span( const ::ROCKSDB_NAMESPACE::Slice &s )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *ptr = reinterpret_cast<const uint8_t *>( s.data() );
        return gsl::make_span( ptr, s.size() );
    }

    inline base::Buffer make_buffer( const ::ROCKSDB_NAMESPACE::Slice &s )
    {
        return base::Buffer( make_span( s ) );
    }

} // namespace qstore::storage

#endif // QSTORE_STORAGE_ROCKSDB_UTIL_HPP
