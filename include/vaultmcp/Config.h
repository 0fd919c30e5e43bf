//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration aggregated from defaults, environment and command-line flags
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace vaultmcp {

//==========================================================================================================
// ServerConfig
// Purpose: Every tunable of the vault server.
// Fields:
//   address/port/scheme/certFile/keyFile: HTTP listener (scheme "http" or "https"; https needs PEM files).
//   vaultPath: Root directory of the document store.
//   readOnly: Deny create/update/delete at the firewall.
//   apiKey: When non-empty, every route requires Bearer <key> or Basic with password == key.
//   enableConcurrentSessions/maxConcurrentConnections: Pooling switch and capacity.
//   sessionTimeoutMs/sweepIntervalMs: Idle eviction.
//   maxQueueSize/requestTimeoutMs: Worker pool backpressure and per-item deadline.
//   ioThreads: Threads running the HTTP I/O context.
//   compatFailOpen: Forward requests even when every compatibility handshake version fails.
//   logLevel/logFile: Logger settings.
//==========================================================================================================
struct ServerConfig {
    std::string address{"127.0.0.1"};
    unsigned short port{3001};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;

    std::string vaultPath{"./vault"};
    bool readOnly{false};
    std::string apiKey;

    bool enableConcurrentSessions{false};
    std::size_t maxConcurrentConnections{32};
    std::chrono::milliseconds sessionTimeoutMs{3600000};
    std::chrono::milliseconds sweepIntervalMs{60000};
    std::size_t maxQueueSize{100};
    std::chrono::milliseconds requestTimeoutMs{30000};
    std::size_t ioThreads{4};
    bool compatFailOpen{true};

    std::string logLevel{"info"};
    std::string logFile;

    // Full pooling (per-session handlers, worker pool, capacity eviction) is active only here.
    bool ConcurrentMode() const { return enableConcurrentSessions && maxConcurrentConnections > 1; }

    // Throws std::invalid_argument on inconsistent settings (bad scheme, https without PEM files, zero threads).
    void Validate() const;
};

//==========================================================================================================
// LoadConfigFromEnv
// Purpose: Overlays environment variables onto the defaults.
// Throws:
//   std::invalid_argument naming the variable when a numeric or boolean value cannot be parsed.
//==========================================================================================================
ServerConfig LoadConfigFromEnv();

//==========================================================================================================
// ApplyCommandLine
// Purpose: Overlays --key=value / --key value flags onto cfg. Boolean flags (--read-only, --concurrent)
//          may be given bare.
// Returns:
//   false when --help was requested.
// Throws:
//   std::invalid_argument for unknown flags, missing values or unparsable values.
//==========================================================================================================
bool ApplyCommandLine(ServerConfig& cfg, const std::vector<std::string>& args);

std::string UsageText();

} // namespace vaultmcp
