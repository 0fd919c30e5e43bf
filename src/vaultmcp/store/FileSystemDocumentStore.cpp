//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileSystemDocumentStore.cpp
// Purpose: Vault documents on disk behind the VaultFirewall
//==========================================================================================================

#include "vaultmcp/store/DocumentStore.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vaultmcp {
namespace store {

namespace {
constexpr std::size_t kSnippetMax = 200;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string logicalPath(const fs::path& root, const fs::path& p) {
    return p.lexically_relative(root).generic_string();
}
} // namespace

FileSystemDocumentStore::FileSystemDocumentStore(fs::path rootDir, VaultFirewall fw)
    : root(std::move(rootDir)), firewall(std::move(fw)) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        fs::create_directories(root, ec);
        if (ec) {
            throw DocumentStoreError(DocumentErrorKind::Io,
                                     "Cannot create vault directory '" + root.string() + "': " + ec.message());
        }
        LOG_INFO("Created vault directory {}", root.string());
    }
    root = fs::weakly_canonical(root, ec);
}

std::string FileSystemDocumentStore::Name() const {
    return root.filename().string();
}

bool FileSystemDocumentStore::IsReadOnly() const {
    return firewall.IsReadOnly();
}

std::size_t FileSystemDocumentStore::CountDocuments() const {
    std::size_t count = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec) && !firewall.IsBlocked(logicalPath(root, it->path()))) {
            ++count;
        }
    }
    return count;
}

fs::path FileSystemDocumentStore::resolve(const std::string& normalized) const {
    return normalized.empty() ? root : root / fs::path(normalized);
}

void FileSystemDocumentStore::write(const fs::path& target, const std::string& content) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Cannot create directory for '" + target.string() + "': " + ec.message());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Cannot open '" + logicalPath(root, target) + "' for writing");
    }
    out << content;
    if (!out.good()) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Write failed for '" + logicalPath(root, target) + "'");
    }
}

std::string FileSystemDocumentStore::Read(const std::string& path) {
    const std::string normalized = firewall.Check(Operation::Read, path);
    const fs::path target = resolve(normalized);
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw DocumentStoreError(DocumentErrorKind::NotFound, "File not found: " + normalized);
    }
    std::ifstream in(target, std::ios::binary);
    if (!in.is_open()) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Cannot open '" + normalized + "'");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void FileSystemDocumentStore::Create(const std::string& path, const std::string& content) {
    const std::string normalized = firewall.Check(Operation::Create, path);
    const fs::path target = resolve(normalized);
    std::lock_guard<std::mutex> lock(writeMutex);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        throw DocumentStoreError(DocumentErrorKind::AlreadyExists, "File already exists: " + normalized);
    }
    write(target, content);
    LOG_INFO("Created document {}", normalized);
}

void FileSystemDocumentStore::Update(const std::string& path, const std::string& content) {
    const std::string normalized = firewall.Check(Operation::Update, path);
    const fs::path target = resolve(normalized);
    std::lock_guard<std::mutex> lock(writeMutex);
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw DocumentStoreError(DocumentErrorKind::NotFound, "File not found: " + normalized);
    }
    write(target, content);
    LOG_INFO("Updated document {}", normalized);
}

void FileSystemDocumentStore::Remove(const std::string& path) {
    const std::string normalized = firewall.Check(Operation::Delete, path);
    const fs::path target = resolve(normalized);
    std::lock_guard<std::mutex> lock(writeMutex);
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw DocumentStoreError(DocumentErrorKind::NotFound, "File not found: " + normalized);
    }
    if (!fs::remove(target, ec) || ec) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Cannot delete '" + normalized + "': " + ec.message());
    }
    LOG_INFO("Deleted document {}", normalized);
}

std::vector<DocumentInfo> FileSystemDocumentStore::List(const std::string& directory) {
    const std::string normalized = firewall.Check(Operation::List, directory);
    const fs::path dir = resolve(normalized);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw DocumentStoreError(DocumentErrorKind::NotFound, "Directory not found: " + normalized);
    }
    std::vector<DocumentInfo> out;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        DocumentInfo info;
        info.path = logicalPath(root, it->path());
        if (firewall.IsBlocked(info.path)) {
            continue;
        }
        info.isDirectory = it->is_directory(ec);
        if (!info.isDirectory) {
            info.size = static_cast<uint64_t>(it->file_size(ec));
        }
        out.push_back(std::move(info));
    }
    if (ec) {
        throw DocumentStoreError(DocumentErrorKind::Io, "Cannot list '" + normalized + "': " + ec.message());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.path < b.path; });
    return out;
}

std::vector<SearchHit> FileSystemDocumentStore::Search(const std::string& query, std::size_t limit, std::stop_token st) {
    firewall.Check(Operation::Search, "");
    if (query.empty()) {
        throw DocumentStoreError(DocumentErrorKind::InvalidPath, "Search query must not be empty");
    }
    const std::string needle = toLower(query);

    std::vector<std::string> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string logical = logicalPath(root, it->path());
        if (!firewall.IsBlocked(logical)) {
            files.push_back(std::move(logical));
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<SearchHit> hits;
    for (const auto& file : files) {
        if (st.stop_requested()) {
            LOG_DEBUG("Search for '{}' stopped after {} hits", query, hits.size());
            break;
        }
        std::ifstream in(resolve(file), std::ios::binary);
        if (!in.is_open()) {
            continue;
        }
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (toLower(line).find(needle) == std::string::npos) {
                continue;
            }
            SearchHit hit;
            hit.path = file;
            hit.line = lineNo;
            hit.snippet = line.size() > kSnippetMax ? line.substr(0, kSnippetMax) : line;
            hits.push_back(std::move(hit));
            if (limit != 0 && hits.size() >= limit) {
                return hits;
            }
        }
    }
    return hits;
}

} // namespace store
} // namespace vaultmcp
