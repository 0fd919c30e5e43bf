//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: Runs a named tool inline or on the WorkerPool and maps failures to protocol error codes
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "vaultmcp/WorkerPool.h"
#include "vaultmcp/store/VaultFirewall.h"
#include "vaultmcp/tools/ToolRegistry.h"

namespace vaultmcp {
namespace tools {

//==========================================================================================================
// ToolInvoker
// Purpose: Collaborator interface exposed to the protocol handler.
// Notes:
//   - Worker-eligible tools go through the WorkerPool when one is attached; everything else runs on the
//     calling thread.
//   - Document store failures map to SecurityViolation (permission, blocked or invalid path),
//     ResourceNotFound (missing document) or ToolExecutionFailed; the store's message is kept verbatim.
//==========================================================================================================
class ToolInvoker {
public:
    ToolInvoker(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<WorkerPool> workers);

    WorkResult Invoke(const std::string& sessionId, const std::string& toolName, const JSONValue& params);

    const std::shared_ptr<ToolRegistry>& Registry() const { return registry; }
    bool UsesWorkerPool() const { return static_cast<bool>(workers); }

    static errors::McpError MapStoreError(const store::DocumentStoreError& e);

private:
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<WorkerPool> workers;
};

} // namespace tools
} // namespace vaultmcp
