//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultTools.h
// Purpose: Built-in vault.* and system.info tools backed by an IDocumentStore
//==========================================================================================================

#pragma once

#include <memory>

#include "vaultmcp/store/DocumentStore.h"
#include "vaultmcp/tools/ToolRegistry.h"

namespace vaultmcp {
namespace tools {

//==========================================================================================================
// RegisterVaultTools
// Purpose: Registers vault.list, vault.read, vault.create, vault.update, vault.delete, vault.search
//          (worker-eligible) and system.info on the registry.
//==========================================================================================================
void RegisterVaultTools(ToolRegistry& registry, std::shared_ptr<store::IDocumentStore> store);

} // namespace tools
} // namespace vaultmcp
