//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_vault_tools.cpp
// Purpose: GoogleTests for the vault firewall, filesystem document store and tool invocation
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/WorkerPool.h"
#include "vaultmcp/store/DocumentStore.h"
#include "vaultmcp/store/VaultFirewall.h"
#include "vaultmcp/tools/ToolInvoker.h"
#include "vaultmcp/tools/VaultTools.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>

using namespace vaultmcp;
using namespace vaultmcp::store;
namespace fs = std::filesystem;

namespace {

fs::path makeTempVault(const std::string& tag) {
    auto dir = fs::temp_directory_path() /
               ("vaultmcp-" + tag + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir / "notes");
    std::ofstream(dir / "notes" / "a.md") << "alpha line\nSecond Alpha\n";
    std::ofstream(dir / "notes" / "b.md") << "beta\n";
    std::ofstream(dir / ".mcpignore") << "secret\n";
    return dir;
}

DocumentErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const DocumentStoreError& e) {
        return e.Kind();
    }
    ADD_FAILURE() << "expected DocumentStoreError";
    return DocumentErrorKind::Io;
}

JSONValue args(std::initializer_list<std::pair<const char*, std::string>> kv) {
    JSONValue::Object o;
    for (const auto& [k, v] : kv) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue{std::move(o)};
}

class VaultToolsTest : public ::testing::Test {
protected:
    fs::path dir;
    std::shared_ptr<FileSystemDocumentStore> docs;
    std::shared_ptr<tools::ToolRegistry> registry;

    void SetUp() override {
        dir = makeTempVault("tools");
        docs = std::make_shared<FileSystemDocumentStore>(dir, VaultFirewall());
        registry = std::make_shared<tools::ToolRegistry>();
        tools::RegisterVaultTools(*registry, docs);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

//////////////////////////////////////////// Firewall ////////////////////////////////////////////

TEST(VaultFirewall, NormalizesAndRejectsUnsafePaths) {
    EXPECT_EQ(VaultFirewall::ValidatePath("notes/./a.md", false), "notes/a.md");
    EXPECT_EQ(VaultFirewall::ValidatePath("notes//b.md", false), "notes/b.md");
    EXPECT_EQ(VaultFirewall::ValidatePath("", true), "");
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath("../x", false); }), DocumentErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath("a/../../x", false); }), DocumentErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath("/etc/passwd", false); }), DocumentErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath("a\\b", false); }), DocumentErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath(std::string("a\0b", 3), false); }), DocumentErrorKind::InvalidPath);
    EXPECT_EQ(kindOf([] { VaultFirewall::ValidatePath("", false); }), DocumentErrorKind::InvalidPath);
}

TEST(VaultFirewall, ReadOnlyPresetDeniesWrites) {
    VaultFirewall fw(VaultFirewall::ReadOnlyPreset());
    EXPECT_TRUE(fw.IsReadOnly());
    EXPECT_TRUE(fw.IsAllowed(Operation::Search));
    EXPECT_EQ(fw.Check(Operation::Read, "notes/a.md"), "notes/a.md");
    EXPECT_EQ(kindOf([&] { fw.Check(Operation::Create, "x.md"); }), DocumentErrorKind::PermissionDenied);
    EXPECT_EQ(kindOf([&] { fw.Check(Operation::Delete, "x.md"); }), DocumentErrorKind::PermissionDenied);
}

TEST(VaultFirewall, BlocksIgnoreFileAndPrefixes) {
    VaultFirewall::Options opts;
    opts.blockedPrefixes = {"private"};
    VaultFirewall fw(opts);
    EXPECT_TRUE(fw.IsBlocked(".mcpignore"));
    EXPECT_TRUE(fw.IsBlocked("sub/.mcpignore"));
    EXPECT_TRUE(fw.IsBlocked("private/diary.md"));
    EXPECT_FALSE(fw.IsBlocked("privateer.md"));
    EXPECT_EQ(kindOf([&] { fw.Check(Operation::Read, "private"); }), DocumentErrorKind::PathBlocked);
}

//////////////////////////////////////////// Document store ////////////////////////////////////////////

TEST_F(VaultToolsTest, StoreCrudLifecycle) {
    EXPECT_EQ(docs->Name(), dir.filename().string());
    EXPECT_EQ(docs->CountDocuments(), 2u);

    docs->Create("new/c.md", "gamma");
    EXPECT_EQ(docs->Read("new/c.md"), "gamma");
    EXPECT_EQ(kindOf([&] { docs->Create("new/c.md", "again"); }), DocumentErrorKind::AlreadyExists);

    docs->Update("new/c.md", "delta");
    EXPECT_EQ(docs->Read("new/c.md"), "delta");
    EXPECT_EQ(kindOf([&] { docs->Update("missing.md", "x"); }), DocumentErrorKind::NotFound);

    docs->Remove("new/c.md");
    EXPECT_EQ(kindOf([&] { docs->Read("new/c.md"); }), DocumentErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { docs->Read(".mcpignore"); }), DocumentErrorKind::PathBlocked);
}

TEST_F(VaultToolsTest, ListIsSortedAndHidesBlockedFiles) {
    auto root = docs->List("");
    ASSERT_EQ(root.size(), 1u);
    EXPECT_EQ(root[0].path, "notes");
    EXPECT_TRUE(root[0].isDirectory);

    auto notes = docs->List("notes");
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0].path, "notes/a.md");
    EXPECT_EQ(notes[1].path, "notes/b.md");
    EXPECT_EQ(kindOf([&] { docs->List("nowhere"); }), DocumentErrorKind::NotFound);
}

TEST_F(VaultToolsTest, SearchIsCaseInsensitiveAndLimited) {
    std::stop_source src;
    auto hits = docs->Search("ALPHA", 10, src.get_token());
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].path, "notes/a.md");
    EXPECT_EQ(hits[0].line, 1u);
    EXPECT_EQ(hits[1].line, 2u);
    EXPECT_EQ(docs->Search("alpha", 1, src.get_token()).size(), 1u);
    EXPECT_TRUE(docs->Search("secret", 10, src.get_token()).empty());

    src.request_stop();
    EXPECT_TRUE(docs->Search("alpha", 10, src.get_token()).empty());
}

//////////////////////////////////////////// Tools ////////////////////////////////////////////

TEST_F(VaultToolsTest, RegistryHoldsVaultTools) {
    EXPECT_EQ(registry->Size(), 7u);
    auto search = registry->Find("vault.search");
    ASSERT_TRUE(search.has_value());
    EXPECT_TRUE(search->workerEligible);
    EXPECT_FALSE(registry->Find("vault.read")->workerEligible);
    EXPECT_TRUE(registry->Unregister("system.info"));
    EXPECT_FALSE(registry->Find("system.info").has_value());
}

TEST_F(VaultToolsTest, InvokerMapsStoreErrors) {
    tools::ToolInvoker invoker(registry, nullptr);

    auto notFound = invoker.Invoke("S1", "vault.read", args({{"path", "ghost.md"}}));
    ASSERT_TRUE(notFound.error.has_value());
    EXPECT_EQ(notFound.error->code, JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(notFound.error->data->GetString("kind"), std::optional<std::string>("NOT_FOUND"));

    auto escape = invoker.Invoke("S1", "vault.read", args({{"path", "../../etc/passwd"}}));
    ASSERT_TRUE(escape.error.has_value());
    EXPECT_EQ(escape.error->code, JSONRPCErrorCodes::SecurityViolation);
    EXPECT_EQ(escape.error->data->GetString("kind"), std::optional<std::string>("PATH_NOT_ALLOWED"));

    auto missingArg = invoker.Invoke("S1", "vault.read", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(missingArg.error->code, JSONRPCErrorCodes::InvalidParams);

    auto unknown = invoker.Invoke("S1", "vault.nothing", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(unknown.error->code, JSONRPCErrorCodes::ToolNotFound);
}

TEST_F(VaultToolsTest, ReadOnlyVaultRejectsCreateThroughTool) {
    auto roDocs = std::make_shared<FileSystemDocumentStore>(dir, VaultFirewall(VaultFirewall::ReadOnlyPreset()));
    auto roRegistry = std::make_shared<tools::ToolRegistry>();
    tools::RegisterVaultTools(*roRegistry, roDocs);
    tools::ToolInvoker invoker(roRegistry, nullptr);
    auto r = invoker.Invoke("S1", "vault.create", args({{"path", "x.md"}, {"content", "x"}}));
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::SecurityViolation);
    EXPECT_FALSE(fs::exists(dir / "x.md"));
}

TEST_F(VaultToolsTest, SearchRunsOnWorkerPoolWhenPresent) {
    auto workers = std::make_shared<WorkerPool>();
    tools::ToolInvoker invoker(registry, workers);
    EXPECT_TRUE(invoker.UsesWorkerPool());
    auto r = invoker.Invoke("S1", "vault.search", args({{"query", "beta"}}));
    ASSERT_TRUE(r.Ok());
    EXPECT_EQ(r.value->GetInt("count"), std::optional<int64_t>(1));
    EXPECT_EQ(workers->GetStats().completed, 1u);

    // Non-eligible tools stay inline
    auto list = invoker.Invoke("S1", "vault.list", args({{"directory", "notes"}}));
    ASSERT_TRUE(list.Ok());
    EXPECT_EQ(workers->GetStats().submitted, 1u);
}

TEST_F(VaultToolsTest, SystemInfoReportsVault) {
    tools::ToolInvoker invoker(registry, nullptr);
    auto r = invoker.Invoke("S1", "system.info", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(r.Ok());
    EXPECT_EQ(r.value->GetString("vault"), std::optional<std::string>(dir.filename().string()));
    EXPECT_EQ(r.value->GetBool("readOnly"), std::optional<bool>(false));
    EXPECT_EQ(r.value->GetInt("documentCount"), std::optional<int64_t>(2));
}
