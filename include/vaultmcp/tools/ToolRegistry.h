//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool definitions and the catalog shared by every protocol handler instance
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "vaultmcp/JSONRPCTypes.h"

namespace vaultmcp {
namespace tools {

//==========================================================================================================
// ToolDefinition
// Fields:
//   name, description, inputSchema: Advertised through tools/list.
//   workerEligible: Route invocations through the WorkerPool when pooling is enabled.
//   handler: Returns structured output; throws DocumentStoreError or errors::McpException on failure.
//==========================================================================================================
struct ToolDefinition {
    using Handler = std::function<JSONValue(const JSONValue& args, std::stop_token st)>;

    std::string name;
    std::string description;
    JSONValue inputSchema;
    bool workerEligible{false};
    Handler handler;
};

class ToolRegistry {
public:
    // Adds or replaces a tool by name.
    void Register(ToolDefinition def);
    bool Unregister(const std::string& name);

    std::optional<ToolDefinition> Find(const std::string& name) const;

    // Tools ordered by name.
    std::vector<ToolDefinition> List() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex;
    std::map<std::string, ToolDefinition> tools;
};

} // namespace tools
} // namespace vaultmcp
