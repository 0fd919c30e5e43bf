//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DocumentStore.h
// Purpose: Document store interface keyed by logical vault path and its filesystem implementation
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "vaultmcp/store/VaultFirewall.h"

namespace vaultmcp {
namespace store {

struct DocumentInfo {
    std::string path;
    bool isDirectory{false};
    uint64_t size{0};
};

struct SearchHit {
    std::string path;
    std::size_t line{0};
    std::string snippet;
};

//==========================================================================================================
// IDocumentStore
// Purpose: Opaque read/write/query calls keyed by logical path. Implementations throw DocumentStoreError.
//==========================================================================================================
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    virtual std::string Name() const = 0;
    virtual bool IsReadOnly() const = 0;
    virtual std::size_t CountDocuments() const = 0;

    virtual std::string Read(const std::string& path) = 0;
    virtual void Create(const std::string& path, const std::string& content) = 0;
    virtual void Update(const std::string& path, const std::string& content) = 0;
    virtual void Remove(const std::string& path) = 0;
    virtual std::vector<DocumentInfo> List(const std::string& directory) = 0;

    //==========================================================================================================
    // Search
    // Purpose: Case-insensitive substring search across documents.
    // Args:
    //   query: Non-empty text to look for.
    //   limit: Maximum number of hits (0 = unlimited).
    //   st: Checked between documents; a stop request ends the scan early with the hits found so far.
    // Returns:
    //   Hits ordered by path, then line.
    //==========================================================================================================
    virtual std::vector<SearchHit> Search(const std::string& query, std::size_t limit, std::stop_token st) = 0;
};

//==========================================================================================================
// FileSystemDocumentStore
// Purpose: IDocumentStore rooted at a directory on disk; every call passes through the VaultFirewall.
//==========================================================================================================
class FileSystemDocumentStore : public IDocumentStore {
public:
    FileSystemDocumentStore(std::filesystem::path root, VaultFirewall firewall);

    std::string Name() const override;
    bool IsReadOnly() const override;
    std::size_t CountDocuments() const override;

    std::string Read(const std::string& path) override;
    void Create(const std::string& path, const std::string& content) override;
    void Update(const std::string& path, const std::string& content) override;
    void Remove(const std::string& path) override;
    std::vector<DocumentInfo> List(const std::string& directory) override;
    std::vector<SearchHit> Search(const std::string& query, std::size_t limit, std::stop_token st) override;

    const std::filesystem::path& Root() const { return root; }

private:
    std::filesystem::path resolve(const std::string& normalized) const;
    void write(const std::filesystem::path& target, const std::string& content);

    std::filesystem::path root;
    VaultFirewall firewall;
    std::mutex writeMutex;
};

} // namespace store
} // namespace vaultmcp
