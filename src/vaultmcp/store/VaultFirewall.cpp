//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultFirewall.cpp
// Purpose: Operation permission checks and logical path validation
//==========================================================================================================

#include "vaultmcp/store/VaultFirewall.h"
#include "logging/Logger.h"

namespace vaultmcp {
namespace store {

namespace {
constexpr const char* kIgnoreFile = ".mcpignore";

bool hasPrefixSegment(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/' || prefix.back() == '/';
}
} // namespace

const char* ToString(DocumentErrorKind kind) {
    switch (kind) {
        case DocumentErrorKind::NotFound: return "NOT_FOUND";
        case DocumentErrorKind::AlreadyExists: return "ALREADY_EXISTS";
        case DocumentErrorKind::PermissionDenied: return "PERMISSION_DENIED";
        case DocumentErrorKind::PathBlocked: return "PATH_BLOCKED";
        case DocumentErrorKind::InvalidPath: return "PATH_NOT_ALLOWED";
        case DocumentErrorKind::Io: return "IO_ERROR";
    }
    return "UNKNOWN";
}

const char* ToString(Operation op) {
    switch (op) {
        case Operation::Read: return "read";
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
        case Operation::List: return "list";
        case Operation::Search: return "search";
    }
    return "unknown";
}

VaultFirewall::VaultFirewall() = default;

VaultFirewall::VaultFirewall(Options opts) : options(std::move(opts)) {}

VaultFirewall::Options VaultFirewall::ReadOnlyPreset() {
    Options o;
    o.permissions.read = true;
    o.permissions.create = false;
    o.permissions.update = false;
    o.permissions.remove = false;
    return o;
}

bool VaultFirewall::IsAllowed(Operation op) const {
    switch (op) {
        case Operation::Read:
        case Operation::List:
        case Operation::Search:
            return options.permissions.read;
        case Operation::Create: return options.permissions.create;
        case Operation::Update: return options.permissions.update;
        case Operation::Delete: return options.permissions.remove;
    }
    return false;
}

bool VaultFirewall::IsReadOnly() const {
    return !options.permissions.create && !options.permissions.update && !options.permissions.remove;
}

bool VaultFirewall::IsBlocked(const std::string& normalizedPath) const {
    const auto slash = normalizedPath.rfind('/');
    const std::string base = slash == std::string::npos ? normalizedPath : normalizedPath.substr(slash + 1);
    if (base == kIgnoreFile) {
        return true;
    }
    for (const auto& prefix : options.blockedPrefixes) {
        if (hasPrefixSegment(normalizedPath, prefix)) {
            return true;
        }
    }
    return false;
}

std::string VaultFirewall::ValidatePath(const std::string& path, bool allowEmpty) {
    if (path.find('\0') != std::string::npos) {
        throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Path contains a NUL byte");
    }
    if (path.find('\\') != std::string::npos) {
        throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Path '" + path + "' contains a backslash");
    }
    if (!path.empty() && path.front() == '/') {
        throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Path '" + path + "' must be relative to the vault");
    }
    std::string normalized;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) {
            next = path.size();
        }
        std::string segment = path.substr(pos, next - pos);
        if (segment == "..") {
            throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Path '" + path + "' escapes the vault");
        }
        if (!segment.empty() && segment != ".") {
            if (!normalized.empty()) {
                normalized.push_back('/');
            }
            normalized += segment;
        }
        pos = next + 1;
    }
    if (normalized.empty() && !allowEmpty) {
        throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Path must not be empty");
    }
    return normalized;
}

std::string VaultFirewall::Check(Operation op, const std::string& path) const {
    if (!IsAllowed(op)) {
        LOG_WARN("Firewall: operation '{}' denied on '{}'", ToString(op), path);
        throw DocumentStoreError(DocumentErrorKind::PermissionDenied,
                                 std::string("Operation '") + ToString(op) + "' is not permitted in current security mode");
    }
    const bool allowEmpty = op == Operation::List || op == Operation::Search;
    std::string normalized = ValidatePath(path, allowEmpty);
    if (!normalized.empty() && IsBlocked(normalized)) {
        LOG_WARN("Firewall: access to blocked path '{}'", normalized);
        throw DocumentStoreError(DocumentErrorKind::PathBlocked, "Access to path '" + path + "' is blocked");
    }
    return normalized;
}

} // namespace store
} // namespace vaultmcp
