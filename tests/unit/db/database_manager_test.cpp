#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "face_core/db/connection_pool.hpp"
#include "face_core/db/pooled_connection.hpp"
#include "face_core/errors.hpp"

namespace face_core {

class DatabaseManagerTest : public face_tests::EmbeddingStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"faces", "store_meta"};

  PooledConnection conn(*db_manager_);
  for (const auto &table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name='idx_faces_photo_active'" >>
      idx_count;
  EXPECT_EQ(idx_count, 1);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({ ConnectionPool bad_pool(db_path_.string(), wrong_key, 1); }, std::exception);
  EXPECT_THROW({ DatabaseManager bad_manager(db_path_, wrong_key, 1); }, CorruptStore);
}

TEST_F(DatabaseManagerTest, CreatesMissingParentDirectories) {
  auto nested = temp_dir_ / "a" / "b" / "faces.db";

  DatabaseManager manager(nested, kTestDbKey, 1);

  EXPECT_TRUE(std::filesystem::exists(nested));
  manager.shutdown();
}

}  // namespace face_core
