#include "testutil/storage/base_fs_test.hpp"

namespace test
{

    void FSFixture::clear()
    {
        if ( fs::exists( base_path ) )
        {
            fs::remove_all( base_path );
        }
    }

    FSFixture::FSFixture( fs::path path ) : base_path( fs::temp_directory_path() / std::move( path ) )
    {
        clear();
        mkdir();

        logger = qstore::base::createLogger( "FSFixture" );
        logger->set_level( spdlog::level::debug );
    }

    void FSFixture::SetUp()
    {
        clear();
        mkdir();
    }
}
