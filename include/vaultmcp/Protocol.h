//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, method names and descriptor structures used by the vault server
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <string>
#include <optional>

namespace vaultmcp {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Preferred protocol version (first entry of SUPPORTED_PROTOCOL_VERSIONS)
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Versions accepted by an explicit initialize, newest first
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

// Versions tried, in order, by the internal compatibility handshake
constexpr std::array<const char*, 3> COMPAT_HANDSHAKE_VERSIONS = {
    "2025-06-18", "2024-11-05", "1.0"
};

// HTTP header carrying the session identifier in both directions
constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

// Single JSON-RPC endpoint path
constexpr const char* MCP_ENDPOINT = "/mcp";

// Discovery document path
constexpr const char* WELL_KNOWN_PATH = "/.well-known/appspecific/com.mcp.vault-mcp";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Liveness probes answered by the router without touching any channel
    constexpr const char* SessionPing = "session/ping";
    constexpr const char* StatusPing = "status/ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
}

//==========================================================================================================
// IsKeepalivePing
// Purpose: True for the lightweight liveness methods served on the router fast path.
//==========================================================================================================
inline bool IsKeepalivePing(const std::string& method) {
    return method == Methods::SessionPing || method == Methods::StatusPing;
}

inline bool IsHandshake(const std::string& method) {
    return method == Methods::Initialize;
}

//==========================================================================================================
// IsSupportedProtocolVersion
// Purpose: True when the version string is one an explicit initialize may negotiate.
//==========================================================================================================
inline bool IsSupportedProtocolVersion(const std::string& version) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == v) {
            return true;
        }
    }
    return false;
}

} // namespace vaultmcp
