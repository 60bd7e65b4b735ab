#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

#include "config/config_loader.hpp"

namespace hoya::config {
namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("hoya_config_test_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        for (const auto* name : {"HOYA_SERVER__PORT", "HOYA_SERVER_PORT", "HOYA_FETCH_USE_PROXY",
                                 "HOYA_LOG__LEVEL", "HOYA_ENGINE_ENTRY_POINT"}) {
            ::unsetenv(name);
        }
    }

    void WriteConfig(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigLoaderTest, MissingFileGivesDefaults) {
    const auto config = LoadConfigFromFile(path_);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.fetch.connect_timeout_s, 10);
    EXPECT_EQ(config.engine.entry_point, "_start");
    EXPECT_EQ(config.log.level, "INFO");
}

TEST_F(ConfigLoaderTest, ReadsCamelCaseKeys) {
    WriteConfig(R"({
        "server": {"host": "0.0.0.0", "port": 8080, "workerThreads": 2},
        "fetch": {"connectTimeoutS": 3, "readTimeoutS": 7,
                  "followRedirects": false, "useProxy": false},
        "download": {"timeoutS": 12},
        "engine": {"wasmStackBytes": 131072, "entryPoint": "main"},
        "log": {"level": "debug"}
    })");
    const auto config = LoadConfigFromFile(path_);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.worker_threads, 2);
    EXPECT_EQ(config.fetch.connect_timeout_s, 3);
    EXPECT_EQ(config.fetch.read_timeout_s, 7);
    EXPECT_FALSE(config.fetch.follow_redirects);
    EXPECT_FALSE(config.fetch.use_proxy);
    EXPECT_EQ(config.download.timeout_s, 12);
    EXPECT_EQ(config.engine.wasm_stack_bytes, 131072);
    EXPECT_EQ(config.engine.entry_point, "main");
    EXPECT_EQ(config.log.level, "debug");
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    WriteConfig(R"({"server": {"port": "8080", "host": 5}, "fetch": {"useProxy": "no"}})");
    const auto config = LoadConfigFromFile(path_);
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_TRUE(config.fetch.use_proxy);
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    WriteConfig(R"({"server": {"port": 8080)");
    const auto config = LoadConfigFromFile(path_);
    EXPECT_EQ(config.server.port, 3000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    WriteConfig(R"({"server": {"port": 8080}})");
    auto config = LoadConfigFromFile(path_);

    ::setenv("HOYA_SERVER_PORT", "9001", 1);
    ::setenv("HOYA_FETCH_USE_PROXY", "off", 1);
    ::setenv("HOYA_LOG__LEVEL", "WARN", 1);
    ::setenv("HOYA_ENGINE_ENTRY_POINT", "run", 1);
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.server.port, 9001);
    EXPECT_FALSE(config.fetch.use_proxy);
    EXPECT_EQ(config.log.level, "WARN");
    EXPECT_EQ(config.engine.entry_point, "run");
}

TEST_F(ConfigLoaderTest, DoubleUnderscoreNameWins) {
    Config config{};
    ::setenv("HOYA_SERVER__PORT", "7000", 1);
    ::setenv("HOYA_SERVER_PORT", "7001", 1);
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.server.port, 7000);
}

TEST_F(ConfigLoaderTest, UnparsableNumberKeepsValue) {
    Config config{};
    ::setenv("HOYA_SERVER_PORT", "not-a-port", 1);
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.server.port, 3000);
}

}  // namespace
}  // namespace hoya::config
