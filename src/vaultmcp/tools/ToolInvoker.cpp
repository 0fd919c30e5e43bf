//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: Tool catalog storage and inline/worker invocation with error mapping
//==========================================================================================================

#include "vaultmcp/tools/ToolInvoker.h"
#include "logging/Logger.h"

namespace vaultmcp {
namespace tools {

void ToolRegistry::Register(ToolDefinition def) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string name = def.name;
    tools[name] = std::move(def);
}

bool ToolRegistry::Unregister(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    return tools.erase(name) > 0;
}

std::optional<ToolDefinition> ToolRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tools.find(name);
    if (it == tools.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ToolDefinition> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<ToolDefinition> out;
    out.reserve(tools.size());
    for (const auto& [name, def] : tools) {
        out.push_back(def);
    }
    return out;
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tools.size();
}

ToolInvoker::ToolInvoker(std::shared_ptr<ToolRegistry> reg, std::shared_ptr<WorkerPool> pool)
    : registry(std::move(reg)), workers(std::move(pool)) {}

errors::McpError ToolInvoker::MapStoreError(const store::DocumentStoreError& e) {
    JSONValue::Object data;
    data["kind"] = std::make_shared<JSONValue>(std::string(store::ToString(e.Kind())));
    int code = JSONRPCErrorCodes::ToolExecutionFailed;
    switch (e.Kind()) {
        case store::DocumentErrorKind::PermissionDenied:
        case store::DocumentErrorKind::PathBlocked:
        case store::DocumentErrorKind::InvalidPath:
            code = JSONRPCErrorCodes::SecurityViolation;
            break;
        case store::DocumentErrorKind::NotFound:
            code = JSONRPCErrorCodes::ResourceNotFound;
            break;
        case store::DocumentErrorKind::AlreadyExists:
        case store::DocumentErrorKind::Io:
            code = JSONRPCErrorCodes::ToolExecutionFailed;
            break;
    }
    return errors::makeError(code, e.what(), JSONValue{std::move(data)});
}

WorkResult ToolInvoker::Invoke(const std::string& sessionId, const std::string& toolName, const JSONValue& params) {
    FUNC_SCOPE();
    auto def = registry ? registry->Find(toolName) : std::nullopt;
    if (!def.has_value() || !def->handler) {
        WorkResult r;
        r.error = errors::makeError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + toolName);
        return r;
    }

    // Normalizes every failure to McpException so inline and pooled runs report identically
    auto handler = def->handler;
    WorkItem::Task task = [handler, toolName](const JSONValue& args, std::stop_token st) -> JSONValue {
        try {
            return handler(args, st);
        } catch (const errors::McpException&) {
            throw;
        } catch (const store::DocumentStoreError& e) {
            throw errors::McpException(MapStoreError(e));
        } catch (const std::exception& e) {
            throw errors::McpException(JSONRPCErrorCodes::ToolExecutionFailed,
                                       "Tool '" + toolName + "' failed: " + e.what());
        }
    };

    if (def->workerEligible && workers) {
        LOG_DEBUG("Routing tool {} for session {} through worker pool", toolName, sessionId);
        WorkItem item;
        item.sessionId = sessionId;
        item.operation = toolName;
        item.params = params;
        item.task = std::move(task);
        return workers->Submit(std::move(item)).get();
    }

    WorkResult r;
    try {
        std::stop_source never;
        r.value = task(params, never.get_token());
    } catch (const errors::McpException& e) {
        r.error = e.Error();
    }
    return r;
}

} // namespace tools
} // namespace vaultmcp
