#include <gtest/gtest.h>
#include <stashy/secret_service_vault.hpp>
#include "test_support.hpp"

#include <random>

using namespace stashy;

// Shared contract, run against every vault implementation
static void check_vault_contract(CredentialVault& vault, const std::string& server) {
    auto missing = vault.retrieve(server);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), ErrorCode::NOT_FOUND);

    ASSERT_TRUE(vault.store(server, "tok-1").ok());
    auto first = vault.retrieve(server);
    ASSERT_TRUE(first.ok()) << first.error().to_string();
    EXPECT_EQ(first.value(), "tok-1");

    // Overwrite
    ASSERT_TRUE(vault.store(server, "tok-2").ok());
    EXPECT_EQ(vault.retrieve(server).value(), "tok-2");

    ASSERT_TRUE(vault.remove(server).ok());
    EXPECT_EQ(vault.retrieve(server).error_code(), ErrorCode::NOT_FOUND);

    // Removing again is fine
    EXPECT_TRUE(vault.remove(server).ok());
}

TEST(CredentialVaultTest, MemoryVaultContract) {
    test::MemoryVault vault;
    check_vault_contract(vault, "https://snippets.example.com");
}

TEST(CredentialVaultTest, EntriesAreKeyedByServer) {
    test::MemoryVault vault;
    ASSERT_TRUE(vault.store("https://a.example", "a").ok());
    ASSERT_TRUE(vault.store("https://b.example", "b").ok());

    EXPECT_EQ(vault.retrieve("https://a.example").value(), "a");
    ASSERT_TRUE(vault.remove("https://a.example").ok());
    EXPECT_EQ(vault.retrieve("https://b.example").value(), "b");
}

TEST(CredentialVaultTest, SecretServiceVaultContract) {
    SecretServiceVault vault;
    if (!vault.is_available()) {
        GTEST_SKIP() << "No Secret Service provider reachable";
    }

    std::random_device rd;
    std::string server = "https://stashy-test-" + std::to_string(rd()) + ".invalid";
    check_vault_contract(vault, server);
}

TEST(CredentialVaultTest, SecretServiceVaultNeverLogsSecret) {
    test::CaptureLogger logger;
    SecretServiceVault vault(&logger);
    if (!vault.is_available()) {
        GTEST_SKIP() << "No Secret Service provider reachable";
    }

    std::random_device rd;
    std::string server = "https://stashy-test-" + std::to_string(rd()) + ".invalid";
    ASSERT_TRUE(vault.store(server, "do-not-print-me").ok());
    ASSERT_TRUE(vault.retrieve(server).ok());
    ASSERT_TRUE(vault.remove(server).ok());

    EXPECT_FALSE(logger.contains("do-not-print-me"));
}
