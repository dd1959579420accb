#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "../../common/utilities_test.hpp"
#include "docu_core/db/connection_pool.hpp"
#include "docu_core/db/pooled_connection.hpp"
#include "docu_core/db/sqlite_error_utils.hpp"
#include "docu_core/db/transaction.hpp"

namespace docu_core {

class DatabaseManagerTest : public docu_tests::VectorStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesCollectionTable_OnStoreConstruction) {
  PooledConnection conn(*db_manager_);
  int count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?"
        << settings_.collection_name >>
      count;
  EXPECT_EQ(count, 1) << "Missing table: " << settings_.collection_name;
}

TEST_F(DatabaseManagerTest, UsesWriteAheadLog) {
  PooledConnection conn(*db_manager_);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, TransactionRollsBackWithoutCommit) {
  PooledConnection conn(*db_manager_);
  *conn << "CREATE TABLE scratch (value INTEGER)";
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO scratch (value) VALUES (1)";
  }
  {
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "INSERT INTO scratch (value) VALUES (2)";
    tx.commit();
  }

  int count = 0;
  *conn << "SELECT COUNT(*) FROM scratch" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  // Simulate a new initialization attempt with the wrong key: create a fresh pool with wrong key
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({ docu_core::ConnectionPool bad_pool(temp_db_path_.string(), wrong_key, 1); },
               std::exception);
}

TEST_F(DatabaseManagerTest, ConstraintFailureIsClassified) {
  PooledConnection conn(*db_manager_);
  *conn << "CREATE TABLE unique_values (value TEXT UNIQUE)";
  *conn << "INSERT INTO unique_values (value) VALUES ('a')";

  try {
    *conn << "INSERT INTO unique_values (value) VALUES ('a')";
    FAIL() << "Expected sqlite_exception";
  } catch (const sqlite::sqlite_exception& e) {
    EXPECT_EQ(classify_sqlite_code(e.get_code()), DbErrorKind::Constraint);
    const std::string message = db_error("insert", e).what();
    EXPECT_NE(message.find("insert failed: (constraint)"), std::string::npos) << message;
  }
}

TEST(SqliteErrorUtilsTest, ClassifiesPrimaryAndExtendedCodes) {
  EXPECT_EQ(classify_sqlite_code(SQLITE_BUSY), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_code(SQLITE_LOCKED), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_code(SQLITE_CONSTRAINT_UNIQUE), DbErrorKind::Constraint);
  EXPECT_EQ(classify_sqlite_code(SQLITE_IOERR_READ), DbErrorKind::Io);
  EXPECT_EQ(classify_sqlite_code(SQLITE_NOTADB), DbErrorKind::NotADatabase);
  EXPECT_EQ(classify_sqlite_code(SQLITE_MISMATCH), DbErrorKind::Generic);
  EXPECT_STREQ(to_string(DbErrorKind::NotADatabase), "notadb");
}

TEST_F(DatabaseManagerTest, CreatesMissingParentDirectories) {
  auto dir = docu_tests::TestUtilities::create_temp_dir("db_manager_tests");
  auto nested = dir / "a" / "b" / "store.db";
  {
    DatabaseManager manager(nested, "", 1);
    EXPECT_EQ(manager.db_path(), nested);
  }
  EXPECT_TRUE(std::filesystem::exists(nested.parent_path()));
  std::filesystem::remove_all(dir);
}

}  // namespace docu_core
