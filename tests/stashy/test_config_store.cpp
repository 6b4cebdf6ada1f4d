#include <gtest/gtest.h>
#include <stashy/config_store.hpp>
#include "test_support.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

using namespace stashy;
namespace fs = std::filesystem;

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = test::make_temp_dir("stashy_config_test");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path config_path() const { return test_dir_ / "nested" / "config.json"; }

    void write_raw(const std::string& text) {
        fs::create_directories(config_path().parent_path());
        std::ofstream out(config_path());
        out << text;
    }

    fs::path test_dir_;
};

// ============================================================================
// Load / Save
// ============================================================================

TEST_F(ConfigStoreTest, MissingFileYieldsDefaults) {
    ConfigStore store(config_path());
    auto config = store.load();
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config.value(), Config{});
    EXPECT_FALSE(fs::exists(config_path()));
}

TEST_F(ConfigStoreTest, SaveThenLoadRoundTrip) {
    ConfigStore store(config_path());
    Config config;
    config.server_url = "https://snippets.example.com/api/v1";
    config.default_page_size = 50;
    config.timeout_seconds = 10;

    auto saved = store.save(config);
    ASSERT_TRUE(saved.ok()) << saved.error().to_string();

    auto loaded = ConfigStore(config_path()).load();
    ASSERT_TRUE(loaded.ok()) << loaded.error().to_string();
    EXPECT_EQ(loaded.value(), config);
}

TEST_F(ConfigStoreTest, SaveIsOwnerOnlyAndLeavesNoTempFile) {
    ConfigStore store(config_path());
    ASSERT_TRUE(store.save(Config{}).ok());

    auto perms = fs::status(config_path()).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);

    fs::path temp = config_path();
    temp += ".tmp";
    EXPECT_FALSE(fs::exists(temp));
}

TEST_F(ConfigStoreTest, SaveOverwritesPreviousFile) {
    ConfigStore store(config_path());
    Config first;
    first.server_url = "https://a.example";
    ASSERT_TRUE(store.save(first).ok());

    Config second;
    second.server_url = "https://b.example";
    ASSERT_TRUE(store.save(second).ok());

    EXPECT_EQ(store.load()->server_url, "https://b.example");
}

TEST_F(ConfigStoreTest, PartialFileKeepsDefaults) {
    write_raw(R"({"server_url": "http://localhost:8080"})");
    auto config = ConfigStore(config_path()).load();
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->server_url, "http://localhost:8080");
    EXPECT_EQ(config->default_page_size, DEFAULT_PAGE_SIZE);
    EXPECT_EQ(config->timeout_seconds, DEFAULT_TIMEOUT_SECONDS);
}

TEST_F(ConfigStoreTest, SecretsNeverWritten) {
    ConfigStore store(config_path());
    Config config;
    config.server_url = "https://snippets.example.com";
    ASSERT_TRUE(store.save(config).ok());

    std::ifstream in(config_path());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.find("token"), std::string::npos);
    EXPECT_EQ(text.find("key"), std::string::npos);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ConfigStoreTest, MalformedJsonIsConfigError) {
    write_raw("{ not json");
    auto config = ConfigStore(config_path()).load();
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigStoreTest, NonObjectIsConfigError) {
    write_raw("[1, 2]");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigStoreTest, InvalidValuesAreConfigErrors) {
    write_raw(R"({"default_page_size": 0})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);

    write_raw(R"({"timeout_seconds": "soon"})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigStoreTest, UnknownFieldIsConfigError) {
    write_raw(R"({"server_url": "https://snip.test", "api_key": "sk-stray"})");
    auto config = ConfigStore(config_path()).load();
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::CONFIG_ERROR);
    EXPECT_NE(config.error().message().find("api_key"), std::string::npos);
    EXPECT_NE(config.error().message().find(config_path().string()), std::string::npos);
}

TEST_F(ConfigStoreTest, NegativePageSizeIsConfigError) {
    write_raw(R"({"default_page_size": -5})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);

    write_raw(R"({"default_page_size": 2.5})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);

    write_raw(R"({"default_page_size": 99999999999})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigStoreTest, TimeoutOutOfRangeIsConfigError) {
    write_raw(R"({"timeout_seconds": 3000000})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);

    write_raw(R"({"timeout_seconds": -1})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);

    write_raw(R"({"timeout_seconds": 3600})");
    auto config = ConfigStore(config_path()).load();
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config->timeout_seconds, MAX_TIMEOUT_SECONDS);
}

TEST_F(ConfigStoreTest, WrongTypeServerUrlIsConfigError) {
    write_raw(R"({"server_url": 42})");
    EXPECT_EQ(ConfigStore(config_path()).load().error_code(), ErrorCode::CONFIG_ERROR);
}

// ============================================================================
// Location
// ============================================================================

TEST_F(ConfigStoreTest, DirectoryOverrideFromEnvironment) {
    ::setenv("STASHY_CONFIG_DIR", test_dir_.c_str(), 1);
    EXPECT_EQ(ConfigStore::at_default_location().path(), test_dir_ / "config.json");
    ::unsetenv("STASHY_CONFIG_DIR");
}

TEST_F(ConfigStoreTest, XdgConfigHomeUsedWhenNoOverride) {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string previous = saved ? saved : "";

    ::unsetenv("STASHY_CONFIG_DIR");
    ::setenv("XDG_CONFIG_HOME", test_dir_.c_str(), 1);
    EXPECT_EQ(ConfigStore::default_directory(), test_dir_ / "stashy");

    if (saved) {
        ::setenv("XDG_CONFIG_HOME", previous.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}
