#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "batch_core/services/encryption_key_service.hpp"
#include "utilities_test.hpp"

namespace batch_core {

class EncryptionKeyServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv(EncryptionKeyService::ENV_VAR_NAME);
    dir_ = batch_tests::TestUtilities::create_temp_dir("batchforge_keys");
  }

  void TearDown() override {
    unsetenv(EncryptionKeyService::ENV_VAR_NAME);
    std::filesystem::remove_all(dir_);
  }

  std::filesystem::path dir_;
};

TEST_F(EncryptionKeyServiceTest, GeneratesAndPersistsNewKey) {
  auto key_file = dir_ / "nested" / "tasks.db.key";

  std::string key = EncryptionKeyService::get_database_key(key_file);
  EXPECT_EQ(key.size(), 64u);
  EXPECT_EQ(key.find_first_not_of("0123456789abcdef"), std::string::npos);
  ASSERT_TRUE(std::filesystem::exists(key_file));

  auto perms = std::filesystem::status(key_file).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_all, std::filesystem::perms::none);
  EXPECT_EQ(perms & std::filesystem::perms::others_all, std::filesystem::perms::none);

  // Same key on the next call
  EXPECT_EQ(EncryptionKeyService::get_database_key(key_file), key);
}

TEST_F(EncryptionKeyServiceTest, ReadsExistingKeyFileTrimmed) {
  auto key_file = dir_ / "existing.key";
  {
    std::ofstream out(key_file);
    out << "  secret-from-file\n";
  }
  EXPECT_EQ(EncryptionKeyService::get_database_key(key_file), "secret-from-file");
}

TEST_F(EncryptionKeyServiceTest, EnvironmentOverridesKeyFile) {
  setenv(EncryptionKeyService::ENV_VAR_NAME, "from-env", 1);
  auto key_file = dir_ / "unused.key";

  EXPECT_EQ(EncryptionKeyService::get_database_key(key_file), "from-env");
  EXPECT_FALSE(std::filesystem::exists(key_file));
}

TEST_F(EncryptionKeyServiceTest, DefaultKeyFileSitsBesideDatabase) {
  EXPECT_EQ(EncryptionKeyService::default_key_file("/var/lib/batchforge/tasks.db"),
            std::filesystem::path("/var/lib/batchforge/tasks.db.key"));
}

} // namespace batch_core
