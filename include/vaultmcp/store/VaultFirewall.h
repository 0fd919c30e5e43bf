//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultFirewall.h
// Purpose: Operation permissions and logical path validation for vault document access
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace vaultmcp {
namespace store {

enum class DocumentErrorKind {
    NotFound,
    AlreadyExists,
    PermissionDenied,
    PathBlocked,
    InvalidPath,
    Io
};

const char* ToString(DocumentErrorKind kind);

//==========================================================================================================
// DocumentStoreError
// Purpose: Failure raised by the document store or its firewall; the message is forwarded verbatim to
//          the client inside a protocol error.
//==========================================================================================================
class DocumentStoreError : public std::runtime_error {
public:
    DocumentStoreError(DocumentErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    DocumentErrorKind Kind() const noexcept { return kind; }

private:
    DocumentErrorKind kind;
};

enum class Operation {
    Read,
    Create,
    Update,
    Delete,
    List,
    Search
};

const char* ToString(Operation op);

struct OperationPermissions {
    bool read{true};
    bool create{true};
    bool update{true};
    bool remove{true};
};

//==========================================================================================================
// VaultFirewall
// Purpose: Single checkpoint for every document operation.
// Rules:
//   - The operation must be permitted (the read-only preset denies create/update/delete).
//   - Paths must be relative, non-empty (except for listing the root), free of ".." segments, NUL bytes
//     and backslashes.
//   - Paths under a blocked prefix, and the ".mcpignore" control file, are rejected.
//==========================================================================================================
class VaultFirewall {
public:
    struct Options {
        OperationPermissions permissions;
        std::vector<std::string> blockedPrefixes;
    };

    VaultFirewall();
    explicit VaultFirewall(Options opts);

    static Options ReadOnlyPreset();

    // Throws DocumentStoreError when the operation on path is not allowed; returns the normalized path.
    std::string Check(Operation op, const std::string& path) const;

    bool IsAllowed(Operation op) const;
    bool IsBlocked(const std::string& normalizedPath) const;
    bool IsReadOnly() const;

    // Normalizes separators and strips leading "./" and trailing "/"; throws InvalidPath on violations.
    static std::string ValidatePath(const std::string& path, bool allowEmpty);

private:
    Options options;
};

} // namespace store
} // namespace vaultmcp
