#include <gtest/gtest.h>
#include <cstdlib>
#include "holdem/errors.hpp"
#include "holdem/random_source.hpp"
#include "service/server_config.hpp"

using namespace holdem;
using namespace holdem::service;

// =============================================================================
// Environment Configuration
// =============================================================================

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("PORT");
        unsetenv("HOLDEM_MAX_TABLES");
        unsetenv("HOLDEM_SHUFFLE_SEED");
    }
};

TEST_F(ServerConfigTest, NoEnvironment_ShouldUseDefaults) {
    auto config = ServerConfig::from_env();

    EXPECT_EQ(config.port, "50410");
    EXPECT_EQ(config.max_tables, 1024u);
    EXPECT_FALSE(config.shuffle_seed.has_value());
    EXPECT_EQ(config.listen_address(), "0.0.0.0:50410");
}

TEST_F(ServerConfigTest, Environment_ShouldOverrideDefaults) {
    setenv("PORT", "6000", 1);
    setenv("HOLDEM_MAX_TABLES", "16", 1);
    setenv("HOLDEM_SHUFFLE_SEED", "replay", 1);

    auto config = ServerConfig::from_env();

    EXPECT_EQ(config.port, "6000");
    EXPECT_EQ(config.max_tables, 16u);
    ASSERT_TRUE(config.shuffle_seed.has_value());
    EXPECT_EQ(*config.shuffle_seed, seed_from_bytes("replay"));
}

TEST_F(ServerConfigTest, MalformedValues_ShouldBeRejected) {
    setenv("HOLDEM_MAX_TABLES", "lots", 1);
    EXPECT_THROW(ServerConfig::from_env(), CommandRejectedError);

    setenv("HOLDEM_MAX_TABLES", "0", 1);
    EXPECT_THROW(ServerConfig::from_env(), CommandRejectedError);

    unsetenv("HOLDEM_MAX_TABLES");
    setenv("PORT", "70000", 1);
    EXPECT_THROW(ServerConfig::from_env(), CommandRejectedError);
}
