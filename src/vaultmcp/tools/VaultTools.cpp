//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultTools.cpp
// Purpose: Vault document tools; argument checking and structured results
//==========================================================================================================

#include "vaultmcp/tools/VaultTools.h"
#include "vaultmcp/Protocol.h"
#include "vaultmcp/errors/Errors.h"
#include "vaultmcp/version.h"
#include "logging/Logger.h"

namespace vaultmcp {
namespace tools {

namespace {
constexpr int64_t kDefaultSearchLimit = 50;

std::shared_ptr<JSONValue> make(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

std::string requireString(const JSONValue& args, const char* key) {
    auto v = args.GetString(key);
    if (!v.has_value()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::string("Missing required string argument '") + key + "'");
    }
    return v.value();
}

JSONValue schema(const char* json) {
    return ParseJSON(json);
}
} // namespace

void RegisterVaultTools(ToolRegistry& registry, std::shared_ptr<store::IDocumentStore> docs) {
    registry.Register(ToolDefinition{
        "vault.list",
        "List files and folders in a vault directory",
        schema(R"({"type":"object","properties":{"directory":{"type":"string"}}})"),
        false,
        [docs](const JSONValue& args, std::stop_token) {
            const std::string dir = args.GetString("directory").value_or("");
            JSONValue::Array entries;
            for (const auto& info : docs->List(dir)) {
                JSONValue::Object e;
                e["path"] = make(JSONValue{info.path});
                e["type"] = make(JSONValue{info.isDirectory ? "directory" : "file"});
                if (!info.isDirectory) {
                    e["size"] = make(JSONValue{static_cast<int64_t>(info.size)});
                }
                entries.push_back(make(JSONValue{std::move(e)}));
            }
            JSONValue::Object out;
            out["directory"] = make(JSONValue{dir});
            out["entries"] = make(JSONValue{std::move(entries)});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "vault.read",
        "Read a document by its vault-relative path",
        schema(R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})"),
        false,
        [docs](const JSONValue& args, std::stop_token) {
            const std::string path = requireString(args, "path");
            JSONValue::Object out;
            out["path"] = make(JSONValue{path});
            out["content"] = make(JSONValue{docs->Read(path)});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "vault.create",
        "Create a new document",
        schema(R"({"type":"object","properties":{"path":{"type":"string"},"content":{"type":"string"}},"required":["path","content"]})"),
        false,
        [docs](const JSONValue& args, std::stop_token) {
            const std::string path = requireString(args, "path");
            docs->Create(path, requireString(args, "content"));
            JSONValue::Object out;
            out["path"] = make(JSONValue{path});
            out["created"] = make(JSONValue{true});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "vault.update",
        "Replace the content of an existing document",
        schema(R"({"type":"object","properties":{"path":{"type":"string"},"content":{"type":"string"}},"required":["path","content"]})"),
        false,
        [docs](const JSONValue& args, std::stop_token) {
            const std::string path = requireString(args, "path");
            docs->Update(path, requireString(args, "content"));
            JSONValue::Object out;
            out["path"] = make(JSONValue{path});
            out["updated"] = make(JSONValue{true});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "vault.delete",
        "Delete a document",
        schema(R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})"),
        false,
        [docs](const JSONValue& args, std::stop_token) {
            const std::string path = requireString(args, "path");
            docs->Remove(path);
            JSONValue::Object out;
            out["path"] = make(JSONValue{path});
            out["deleted"] = make(JSONValue{true});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "vault.search",
        "Case-insensitive text search across vault documents",
        schema(R"({"type":"object","properties":{"query":{"type":"string"},"limit":{"type":"integer","minimum":1}},"required":["query"]})"),
        true,
        [docs](const JSONValue& args, std::stop_token st) {
            const std::string query = requireString(args, "query");
            const int64_t limit = args.GetInt("limit").value_or(kDefaultSearchLimit);
            if (limit < 1) {
                throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Argument 'limit' must be >= 1");
            }
            auto hits = docs->Search(query, static_cast<std::size_t>(limit), st);
            JSONValue::Array results;
            for (const auto& h : hits) {
                JSONValue::Object o;
                o["path"] = make(JSONValue{h.path});
                o["line"] = make(JSONValue{static_cast<int64_t>(h.line)});
                o["snippet"] = make(JSONValue{h.snippet});
                results.push_back(make(JSONValue{std::move(o)}));
            }
            LOG_DEBUG("vault.search '{}' returned {} hits", query, results.size());
            JSONValue::Object out;
            out["query"] = make(JSONValue{query});
            out["count"] = make(JSONValue{static_cast<int64_t>(results.size())});
            out["results"] = make(JSONValue{std::move(results)});
            return JSONValue{std::move(out)};
        }});

    registry.Register(ToolDefinition{
        "system.info",
        "Server and vault information",
        schema(R"({"type":"object","properties":{}})"),
        false,
        [docs](const JSONValue&, std::stop_token) {
            JSONValue::Object out;
            out["server"] = make(JSONValue{SERVER_NAME});
            out["version"] = make(JSONValue{getVersionString()});
            out["protocolVersion"] = make(JSONValue{PROTOCOL_VERSION});
            out["vault"] = make(JSONValue{docs->Name()});
            out["readOnly"] = make(JSONValue{docs->IsReadOnly()});
            out["documentCount"] = make(JSONValue{static_cast<int64_t>(docs->CountDocuments())});
            return JSONValue{std::move(out)};
        }});
}

} // namespace tools
} // namespace vaultmcp
