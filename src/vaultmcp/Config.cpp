//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: ServerConfig loading from environment and command line
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

#include "env/EnvVars.h"
#include "vaultmcp/Config.h"

namespace vaultmcp {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

uint64_t parseUnsigned(const std::string& key, const std::string& value, uint64_t maxValue) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value + "'");
    }
    uint64_t n = 0;
    try {
        n = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(key + ": value out of range '" + value + "'");
    }
    if (n > maxValue) {
        throw std::invalid_argument(key + ": value out of range '" + value + "'");
    }
    return n;
}

bool parseBool(const std::string& key, const std::string& value) {
    const std::string v = lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw std::invalid_argument(key + ": expected a boolean, got '" + value + "'");
}

std::string parseLevel(const std::string& key, const std::string& value) {
    const std::string v = lower(value);
    if (v == "debug" || v == "info" || v == "warn" || v == "warning" || v == "error") {
        return v;
    }
    throw std::invalid_argument(key + ": expected debug|info|warn|error, got '" + value + "'");
}

std::optional<std::string> env(const char* name) {
    if (!HasEnv(name)) {
        return std::nullopt;
    }
    return GetEnvOrDefault(name, "");
}

constexpr uint64_t kMaxSize = std::numeric_limits<uint32_t>::max();

} // namespace

void ServerConfig::Validate() const {
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("scheme: expected http or https, got '" + scheme + "'");
    }
    if (scheme == "https" && (certFile.empty() || keyFile.empty())) {
        throw std::invalid_argument("scheme https requires both a certificate and a key file");
    }
    if (ioThreads == 0) {
        throw std::invalid_argument("ioThreads must be at least 1");
    }
    if (maxConcurrentConnections == 0) {
        throw std::invalid_argument("maxConcurrentConnections must be at least 1");
    }
    if (requestTimeoutMs.count() <= 0) {
        throw std::invalid_argument("requestTimeoutMs must be positive");
    }
    if (vaultPath.empty()) {
        throw std::invalid_argument("vaultPath must not be empty");
    }
}

ServerConfig LoadConfigFromEnv() {
    ServerConfig cfg;
    if (auto v = env("VAULTMCP_ADDRESS")) cfg.address = *v;
    if (auto v = env("PORT")) cfg.port = static_cast<unsigned short>(parseUnsigned("PORT", *v, 65535));
    if (auto v = env("VAULTMCP_PORT")) cfg.port = static_cast<unsigned short>(parseUnsigned("VAULTMCP_PORT", *v, 65535));
    if (auto v = env("VAULTMCP_SCHEME")) cfg.scheme = lower(*v);
    if (auto v = env("VAULTMCP_CERT_FILE")) cfg.certFile = *v;
    if (auto v = env("VAULTMCP_KEY_FILE")) cfg.keyFile = *v;
    if (auto v = env("VAULT_PATH")) cfg.vaultPath = *v;
    if (auto v = env("READ_ONLY")) cfg.readOnly = parseBool("READ_ONLY", *v);
    if (auto v = env("MCP_API_KEY")) cfg.apiKey = *v;
    if (auto v = env("VAULTMCP_CONCURRENT")) cfg.enableConcurrentSessions = parseBool("VAULTMCP_CONCURRENT", *v);
    if (auto v = env("VAULTMCP_MAX_CONNECTIONS")) {
        cfg.maxConcurrentConnections = parseUnsigned("VAULTMCP_MAX_CONNECTIONS", *v, kMaxSize);
    }
    if (auto v = env("VAULTMCP_SESSION_TIMEOUT_MS")) {
        cfg.sessionTimeoutMs = std::chrono::milliseconds(parseUnsigned("VAULTMCP_SESSION_TIMEOUT_MS", *v, kMaxSize));
    }
    if (auto v = env("VAULTMCP_SWEEP_INTERVAL_MS")) {
        cfg.sweepIntervalMs = std::chrono::milliseconds(parseUnsigned("VAULTMCP_SWEEP_INTERVAL_MS", *v, kMaxSize));
    }
    if (auto v = env("VAULTMCP_MAX_QUEUE")) cfg.maxQueueSize = parseUnsigned("VAULTMCP_MAX_QUEUE", *v, kMaxSize);
    if (auto v = env("VAULTMCP_REQUEST_TIMEOUT_MS")) {
        cfg.requestTimeoutMs = std::chrono::milliseconds(parseUnsigned("VAULTMCP_REQUEST_TIMEOUT_MS", *v, kMaxSize));
    }
    if (auto v = env("VAULTMCP_IO_THREADS")) cfg.ioThreads = parseUnsigned("VAULTMCP_IO_THREADS", *v, 256);
    if (auto v = env("VAULTMCP_COMPAT_FAIL_OPEN")) cfg.compatFailOpen = parseBool("VAULTMCP_COMPAT_FAIL_OPEN", *v);
    if (auto v = env("VAULTMCP_LOG_LEVEL")) cfg.logLevel = parseLevel("VAULTMCP_LOG_LEVEL", *v);
    if (auto v = env("VAULTMCP_LOG_FILE")) cfg.logFile = *v;
    return cfg;
}

bool ApplyCommandLine(ServerConfig& cfg, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string key = args[i];
        std::optional<std::string> value;
        const auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        }

        if (key == "--help" || key == "-h") {
            return false;
        }
        if (key == "--read-only" || key == "--concurrent") {
            const bool flag = value.has_value() ? parseBool(key, *value) : true;
            if (key == "--read-only") {
                cfg.readOnly = flag;
            } else {
                cfg.enableConcurrentSessions = flag;
            }
            continue;
        }

        if (!value.has_value()) {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(key + ": missing value");
            }
            value = args[++i];
        }
        const std::string& v = *value;
        if (key == "--address") {
            cfg.address = v;
        } else if (key == "--port") {
            cfg.port = static_cast<unsigned short>(parseUnsigned(key, v, 65535));
        } else if (key == "--scheme") {
            cfg.scheme = lower(v);
        } else if (key == "--cert") {
            cfg.certFile = v;
        } else if (key == "--key") {
            cfg.keyFile = v;
        } else if (key == "--vault") {
            cfg.vaultPath = v;
        } else if (key == "--api-key") {
            cfg.apiKey = v;
        } else if (key == "--max-connections") {
            cfg.maxConcurrentConnections = parseUnsigned(key, v, kMaxSize);
        } else if (key == "--log-level") {
            cfg.logLevel = parseLevel(key, v);
        } else if (key == "--log-file") {
            cfg.logFile = v;
        } else {
            throw std::invalid_argument("Unknown option: " + key);
        }
    }
    return true;
}

std::string UsageText() {
    return
        "Usage: vault_mcp_server [options]\n"
        "  --address=<ip>            Bind address (VAULTMCP_ADDRESS, default 127.0.0.1)\n"
        "  --port=<n>                Listen port (PORT / VAULTMCP_PORT, default 3001)\n"
        "  --scheme=http|https       Listener scheme (VAULTMCP_SCHEME)\n"
        "  --cert=<pem> --key=<pem>  TLS files for https (VAULTMCP_CERT_FILE / VAULTMCP_KEY_FILE)\n"
        "  --vault=<dir>             Vault root (VAULT_PATH, default ./vault)\n"
        "  --read-only               Deny writes (READ_ONLY)\n"
        "  --api-key=<key>           Require Bearer/Basic auth (MCP_API_KEY)\n"
        "  --concurrent              Per-session handlers and worker pool (VAULTMCP_CONCURRENT)\n"
        "  --max-connections=<n>     Session and worker capacity (VAULTMCP_MAX_CONNECTIONS, default 32)\n"
        "  --log-level=<lvl>         debug|info|warn|error (VAULTMCP_LOG_LEVEL)\n"
        "  --log-file=<path>         Also write logs to file (VAULTMCP_LOG_FILE)\n";
}

} // namespace vaultmcp
