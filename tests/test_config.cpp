//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: GoogleTests for environment and command-line configuration
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/Config.h"
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vaultmcp;

namespace {

const char* const kVars[] = {
    "VAULTMCP_ADDRESS", "PORT", "VAULTMCP_PORT", "VAULTMCP_SCHEME", "VAULTMCP_CERT_FILE", "VAULTMCP_KEY_FILE",
    "VAULT_PATH", "READ_ONLY", "MCP_API_KEY", "VAULTMCP_CONCURRENT", "VAULTMCP_MAX_CONNECTIONS",
    "VAULTMCP_SESSION_TIMEOUT_MS", "VAULTMCP_SWEEP_INTERVAL_MS", "VAULTMCP_MAX_QUEUE",
    "VAULTMCP_REQUEST_TIMEOUT_MS", "VAULTMCP_IO_THREADS", "VAULTMCP_COMPAT_FAIL_OPEN", "VAULTMCP_LOG_LEVEL",
    "VAULTMCP_LOG_FILE"};

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : kVars) {
            ::unsetenv(v);
        }
    }
    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

} // namespace

TEST_F(ConfigEnvTest, DefaultsWhenUnset) {
    ServerConfig cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.address, "127.0.0.1");
    EXPECT_EQ(cfg.port, 3001);
    EXPECT_EQ(cfg.scheme, "http");
    EXPECT_EQ(cfg.vaultPath, "./vault");
    EXPECT_FALSE(cfg.readOnly);
    EXPECT_TRUE(cfg.apiKey.empty());
    EXPECT_FALSE(cfg.enableConcurrentSessions);
    EXPECT_EQ(cfg.maxConcurrentConnections, 32u);
    EXPECT_EQ(cfg.sessionTimeoutMs.count(), 3600000);
    EXPECT_TRUE(cfg.compatFailOpen);
    EXPECT_FALSE(cfg.ConcurrentMode());
    EXPECT_NO_THROW(cfg.Validate());
}

TEST_F(ConfigEnvTest, ReadsEnvironment) {
    set("PORT", "4000");
    set("VAULTMCP_PORT", "4100");
    set("VAULT_PATH", "/srv/notes");
    set("READ_ONLY", "yes");
    set("MCP_API_KEY", "k3y");
    set("VAULTMCP_CONCURRENT", "true");
    set("VAULTMCP_MAX_CONNECTIONS", "8");
    set("VAULTMCP_SESSION_TIMEOUT_MS", "5000");
    set("VAULTMCP_COMPAT_FAIL_OPEN", "off");
    set("VAULTMCP_LOG_LEVEL", "DEBUG");

    ServerConfig cfg = LoadConfigFromEnv();
    EXPECT_EQ(cfg.port, 4100); // VAULTMCP_PORT wins over PORT
    EXPECT_EQ(cfg.vaultPath, "/srv/notes");
    EXPECT_TRUE(cfg.readOnly);
    EXPECT_EQ(cfg.apiKey, "k3y");
    EXPECT_TRUE(cfg.ConcurrentMode());
    EXPECT_EQ(cfg.maxConcurrentConnections, 8u);
    EXPECT_EQ(cfg.sessionTimeoutMs.count(), 5000);
    EXPECT_FALSE(cfg.compatFailOpen);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST_F(ConfigEnvTest, ConcurrencyNeedsMoreThanOneConnection) {
    set("VAULTMCP_CONCURRENT", "1");
    set("VAULTMCP_MAX_CONNECTIONS", "1");
    EXPECT_FALSE(LoadConfigFromEnv().ConcurrentMode());
}

TEST_F(ConfigEnvTest, MalformedValuesNameTheVariable) {
    set("PORT", "80a");
    try {
        LoadConfigFromEnv();
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("PORT"), std::string::npos);
    }
    clear();
    set("VAULTMCP_PORT", "70000");
    EXPECT_THROW(LoadConfigFromEnv(), std::invalid_argument);
    clear();
    set("READ_ONLY", "maybe");
    EXPECT_THROW(LoadConfigFromEnv(), std::invalid_argument);
    clear();
    set("VAULTMCP_LOG_LEVEL", "chatty");
    EXPECT_THROW(LoadConfigFromEnv(), std::invalid_argument);
}

TEST(ConfigCommandLine, OverridesAndFlags) {
    ServerConfig cfg;
    std::vector<std::string> args{"--port=9000", "--vault", "/tmp/v", "--read-only", "--concurrent=false",
                                  "--max-connections", "4", "--api-key=abc", "--log-level=warn"};
    ASSERT_TRUE(ApplyCommandLine(cfg, args));
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.vaultPath, "/tmp/v");
    EXPECT_TRUE(cfg.readOnly);
    EXPECT_FALSE(cfg.enableConcurrentSessions);
    EXPECT_EQ(cfg.maxConcurrentConnections, 4u);
    EXPECT_EQ(cfg.apiKey, "abc");
    EXPECT_EQ(cfg.logLevel, "warn");
}

TEST(ConfigCommandLine, HelpAndErrors) {
    ServerConfig cfg;
    EXPECT_FALSE(ApplyCommandLine(cfg, {"--help"}));
    EXPECT_FALSE(ApplyCommandLine(cfg, {"-h"}));
    EXPECT_THROW(ApplyCommandLine(cfg, {"--bogus=1"}), std::invalid_argument);
    EXPECT_THROW(ApplyCommandLine(cfg, {"--port"}), std::invalid_argument);
    EXPECT_THROW(ApplyCommandLine(cfg, {"--port=-1"}), std::invalid_argument);
    EXPECT_NE(UsageText().find("--vault"), std::string::npos);
}

TEST(ConfigValidate, RejectsInconsistentSettings) {
    ServerConfig https;
    https.scheme = "https";
    EXPECT_THROW(https.Validate(), std::invalid_argument);
    https.certFile = "cert.pem";
    https.keyFile = "key.pem";
    EXPECT_NO_THROW(https.Validate());

    ServerConfig badScheme;
    badScheme.scheme = "ftp";
    EXPECT_THROW(badScheme.Validate(), std::invalid_argument);

    ServerConfig noThreads;
    noThreads.ioThreads = 0;
    EXPECT_THROW(noThreads.Validate(), std::invalid_argument);

    ServerConfig noVault;
    noVault.vaultPath.clear();
    EXPECT_THROW(noVault.Validate(), std::invalid_argument);
}
