

#include "testutil/storage/base_fs_test.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "storage/rocksdb/rocksdb_log_database.hpp"
#include "storage/database_error.hpp"
#include "testutil/outcome.hpp"

namespace fs = boost::filesystem;

namespace qstore::storage
{
    struct rocksdb_Open : public test::FSFixture
    {
        rocksdb_Open() : test::FSFixture( "qstore_rocksdb_open" )
        {
        }
    };

  /**
   * @given options with disabled option `create_if_missing`
   * @when open database
   * @then database can not be opened (since there is no db already)
   */
  TEST_F(rocksdb_Open, OpenNonExistingDB) {
    RocksLogDatabase::Options options;
    options.create_if_missing = false;  // intentionally

    auto r = RocksLogDatabase::create(getPathString(), options);
    EXPECT_FALSE(r);
    EXPECT_EQ(r.error(), DatabaseError::INVALID_ARGUMENT);
  }

  /**
   * @given options with enable option `create_if_missing`
   * @when open database
   * @then database is opened
   */
  TEST_F(rocksdb_Open, OpenExistingDB) {
    RocksLogDatabase::Options options;
    options.create_if_missing = true;  // intentionally

    EXPECT_OUTCOME_TRUE_2(db, RocksLogDatabase::create(getPathString(), options));
    EXPECT_TRUE(db) << "db is nullptr";

    boost::filesystem::path p(getPathString());
    EXPECT_TRUE(fs::exists(p));
  }

  /**
   * @given a log database held open by this process
   * @when the same directory is opened again
   * @then the RocksDB lock file refuses it
   */
  TEST_F(rocksdb_Open, OpenLockedDB) {
    RocksLogDatabase::Options options;
    options.create_if_missing = true;

    EXPECT_OUTCOME_TRUE_2(db, RocksLogDatabase::create(getPathString(), options));
    EXPECT_OUTCOME_ERROR(RocksLogDatabase::create(getPathString(), options),
                         DatabaseError::IO_ERROR);

    db.reset();
    EXPECT_OUTCOME_TRUE_1(RocksLogDatabase::create(getPathString(), options));
  }
}
