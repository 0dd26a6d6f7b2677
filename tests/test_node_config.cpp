#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "node_config.hpp"

using namespace pricemesh;

namespace {

nlohmann::json minimalConfig() {
    return nlohmann::json{
        {"node_id", "bsc-a"},
        {"signing", {{"mode", "hmac-sha256"}, {"key", "secret"}}}};
}

} // namespace

TEST(NodeConfigTest, DefaultsApply) {
    const NodeConfig config = NodeConfig::fromJson(minimalConfig());
    EXPECT_EQ(config.node_id, "bsc-a");
    EXPECT_EQ(config.capacity, 1100u);
    EXPECT_TRUE(config.production);
    EXPECT_TRUE(config.shared_memory_name.empty());
    EXPECT_EQ(config.coherency.gossip_interval.count(), 1000);
    EXPECT_EQ(config.coherency.max_entries_per_message, 512u);
    EXPECT_EQ(config.store.max_read_retries, 1000000u);
    EXPECT_EQ(config.store.max_origins, 1000u);
    EXPECT_EQ(config.coherency.full_sync_interval_rounds, 60u);
    ASSERT_TRUE(config.signing.has_value());
    EXPECT_TRUE(config.signing->isSigned());
    EXPECT_EQ(config.signing->key(), "secret");
}

TEST(NodeConfigTest, FullDocument) {
    const auto json = nlohmann::json::parse(R"({
        "node_id": "bsc-b",
        "capacity": 2048,
        "gossip_interval_ms": 250,
        "max_entries_per_message": 64,
        "max_read_retries": 5000,
        "production": false,
        "log_level": "debug",
        "shared_memory": { "name": "pricemesh-l1" },
        "signing": { "mode": "unsigned" },
        "full_sync_interval_rounds": 10,
        "peers": { "suspicion_timeout_ms": 2000, "failure_timeout_ms": 6000, "max_peers": 15 }
    })");

    const NodeConfig config = NodeConfig::fromJson(json);
    EXPECT_EQ(config.capacity, 2048u);
    EXPECT_EQ(config.coherency.gossip_interval.count(), 250);
    EXPECT_EQ(config.coherency.max_entries_per_message, 64u);
    EXPECT_EQ(config.store.max_read_retries, 5000u);
    EXPECT_FALSE(config.production);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.shared_memory_name, "pricemesh-l1");
    EXPECT_EQ(config.coherency.suspicion_timeout.count(), 2000);
    EXPECT_EQ(config.coherency.failure_timeout.count(), 6000);
    EXPECT_EQ(config.coherency.full_sync_interval_rounds, 10u);
    EXPECT_EQ(config.store.max_origins, 16u);
    EXPECT_FALSE(config.makeSigner().isSigned());
}

TEST(NodeConfigTest, KeyFromEnvironment) {
    auto json = minimalConfig();
    json["signing"] = {{"mode", "hmac-sha256"}, {"key_env", "PRICEMESH_TEST_GOSSIP_KEY"}};

    ::unsetenv("PRICEMESH_TEST_GOSSIP_KEY");
    EXPECT_THROW(NodeConfig::fromJson(json), std::invalid_argument);

    ::setenv("PRICEMESH_TEST_GOSSIP_KEY", "from-env", 1);
    const NodeConfig config = NodeConfig::fromJson(json);
    EXPECT_EQ(config.signing->key(), "from-env");
    ::unsetenv("PRICEMESH_TEST_GOSSIP_KEY");
}

TEST(NodeConfigTest, SigningMustBeExplicit) {
    auto no_mode = minimalConfig();
    no_mode["signing"] = {{"key", "secret"}};
    EXPECT_THROW(NodeConfig::fromJson(no_mode), std::invalid_argument);

    auto bad_mode = minimalConfig();
    bad_mode["signing"] = {{"mode", "rot13"}};
    EXPECT_THROW(NodeConfig::fromJson(bad_mode), std::invalid_argument);

    auto no_key = minimalConfig();
    no_key["signing"] = {{"mode", "hmac-sha256"}};
    EXPECT_THROW(NodeConfig::fromJson(no_key), std::invalid_argument);

    auto absent = minimalConfig();
    absent.erase("signing");
    const NodeConfig config = NodeConfig::fromJson(absent);
    EXPECT_THROW(config.makeSigner(), std::invalid_argument);
}

TEST(NodeConfigTest, UnsignedRefusedInProduction) {
    auto json = minimalConfig();
    json["signing"] = {{"mode", "unsigned"}};
    const NodeConfig config = NodeConfig::fromJson(json);
    EXPECT_THROW(config.makeSigner(), std::invalid_argument);
}

TEST(NodeConfigTest, InvalidValuesRejected) {
    auto missing_id = minimalConfig();
    missing_id.erase("node_id");
    EXPECT_THROW(NodeConfig::fromJson(missing_id), std::invalid_argument);

    auto zero_capacity = minimalConfig();
    zero_capacity["capacity"] = 0;
    EXPECT_THROW(NodeConfig::fromJson(zero_capacity), std::invalid_argument);

    auto zero_interval = minimalConfig();
    zero_interval["gossip_interval_ms"] = 0;
    EXPECT_THROW(NodeConfig::fromJson(zero_interval), std::invalid_argument);

    auto wrong_type = minimalConfig();
    wrong_type["capacity"] = "lots";
    EXPECT_THROW(NodeConfig::fromJson(wrong_type), std::invalid_argument);

    auto no_peers = minimalConfig();
    no_peers["peers"] = {{"max_peers", 0}};
    EXPECT_THROW(NodeConfig::fromJson(no_peers), std::invalid_argument);

    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST(NodeConfigTest, LoadsFromFile) {
    const std::string path = "pricemesh_config_test_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream file(path);
        file << minimalConfig().dump();
    }
    EXPECT_EQ(NodeConfig::fromFile(path).node_id, "bsc-a");

    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(NodeConfig::fromFile(path), std::invalid_argument);
    std::remove(path.c_str());

    EXPECT_THROW(NodeConfig::fromFile("/nonexistent/pricemesh.json"), std::invalid_argument);
}

TEST(NodeConfigTest, LogLevels) {
    EXPECT_NO_THROW(configureLogging("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_NO_THROW(configureLogging("WARN"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_THROW(configureLogging("chatty"), std::invalid_argument);
    configureLogging("info");
}
