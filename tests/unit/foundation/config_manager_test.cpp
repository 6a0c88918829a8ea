#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "latchkey/foundation/config_manager.hpp"

using namespace latchkey::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel runs do not collide
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("latchkey_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("latchkey.yaml", R"(
environment: production
remember_me:
  cookie_name: "keep_me"
  lifetime_days: 14
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto days = config.get<int>("remember_me.lifetime_days");
    ASSERT_TRUE(days.hasValue());
    EXPECT_EQ(days.value(), 14);

    auto name = config.get<std::string>("remember_me.cookie_name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "keep_me");

    EXPECT_EQ(config.get<std::string>("environment").value(), "production");
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("broken.yaml", "remember_me: [unterminated");
    ConfigManager config;
    auto result = config.load(path);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerStringTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(ConfigManagerStringTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerStringTest, EmptyDocumentIsValid) {
    ConfigManager config;
    EXPECT_TRUE(config.loadFromString("").hasValue());
    EXPECT_FALSE(config.hasKey("environment"));
}

TEST(ConfigManagerStringTest, RootMustBeMapping) {
    ConfigManager config;
    auto result = config.loadFromString("- a\n- b\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerStringTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST(ConfigManagerStringTest, GetOrFallsBackOnlyWhenMissing) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("csrf:\n  header_name: 42x\n").hasValue());

    auto missing = config.getOr<int>("remember_me.lifetime_days", 30);
    ASSERT_TRUE(missing.hasValue());
    EXPECT_EQ(missing.value(), 30);

    auto wrongType = config.getOr<int>("csrf.header_name", 5);
    ASSERT_TRUE(wrongType.hasError());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerStringTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("database.max_connections", 4);

    auto result = config.get<int>("database.max_connections");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 4);
}

TEST(ConfigManagerStringTest, WatchNotification) {
    ConfigManager config;
    int calls = 0;
    std::string notifiedKey;

    config.watch("remember_me.lifetime_days", [&](std::string_view key) {
        ++calls;
        notifiedKey = std::string(key);
    });

    config.set<int>("remember_me.lifetime_days", 7);
    config.set<int>("csrf.unrelated", 1);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(notifiedKey, "remember_me.lifetime_days");
}
