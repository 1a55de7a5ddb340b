#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    std::mutex &registryMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    spdlog::level::level_enum &defaultLevel()
    {
        static spdlog::level::level_enum level = spdlog::level::info;
        return level;
    }

    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag )
    {
        auto logger = spdlog::stdout_color_mt( tag );
        setGlobalPattern( *logger );
        logger->set_level( defaultLevel() );
        return logger;
    }
} // namespace

namespace qstore::base
{
    Logger createLogger( const std::string &tag )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag );
        }
        return logger;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        defaultLevel() = level;
        spdlog::apply_all( [level]( const Logger &logger ) { logger->set_level( level ); } );
    }
} // namespace qstore::base
