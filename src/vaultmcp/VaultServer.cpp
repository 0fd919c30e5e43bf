//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultServer.cpp
// Purpose: Component wiring and HTTP route table
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <ctime>
#include <string>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "vaultmcp/HandlerPool.h"
#include "vaultmcp/Protocol.h"
#include "vaultmcp/ProtocolHandler.h"
#include "vaultmcp/VaultServer.h"
#include "vaultmcp/WorkerPool.h"
#include "vaultmcp/store/DocumentStore.h"
#include "vaultmcp/store/VaultFirewall.h"
#include "vaultmcp/tools/ToolInvoker.h"
#include "vaultmcp/tools/ToolRegistry.h"
#include "vaultmcp/tools/VaultTools.h"
#include "vaultmcp/version.h"

namespace vaultmcp {

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

HttpReply jsonReply(unsigned int status, JSONValue::Object body) {
    HttpReply r;
    r.status = status;
    r.body = SerializeJSON(JSONValue{std::move(body)});
    return r;
}

HttpReply errorReply(unsigned int status, const std::string& message) {
    JSONValue::Object o;
    o["error"] = str(message);
    return jsonReply(status, std::move(o));
}

HttpReply rpcReply(unsigned int status, const JSONRPCResponse& resp) {
    HttpReply r;
    r.status = status;
    r.body = resp.Serialize();
    return r;
}

std::string isoTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(t), ms);
}

} // namespace

class VaultServer::Impl {
public:
    ServerConfig config;
    bool concurrent{false};

    std::shared_ptr<store::IDocumentStore> documents;
    std::shared_ptr<tools::ToolRegistry> registry;
    std::shared_ptr<WorkerPool> workers;
    std::shared_ptr<tools::ToolInvoker> invoker;
    std::shared_ptr<HandlerPool> handlers;
    std::unique_ptr<RequestRouter> router;
    std::unique_ptr<HTTPServer> http;
    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};

    explicit Impl(ServerConfig cfg) : config(std::move(cfg)) {
        config.Validate();
        concurrent = config.ConcurrentMode();

        store::VaultFirewall firewall = config.readOnly
            ? store::VaultFirewall(store::VaultFirewall::ReadOnlyPreset())
            : store::VaultFirewall();
        documents = std::make_shared<store::FileSystemDocumentStore>(config.vaultPath, std::move(firewall));

        registry = std::make_shared<tools::ToolRegistry>();
        tools::RegisterVaultTools(*registry, documents);

        if (concurrent) {
            WorkerPoolOptions wopts;
            wopts.maxWorkers = config.maxConcurrentConnections;
            wopts.maxQueueSize = config.maxQueueSize;
            wopts.timeout = config.requestTimeoutMs;
            workers = std::make_shared<WorkerPool>(wopts);
        }
        invoker = std::make_shared<tools::ToolInvoker>(registry, workers);

        ProtocolHandlerOptions hopts;
        hopts.invoker = invoker;
        hopts.store = documents;
        hopts.serverInfo = Implementation(SERVER_NAME, getVersionString());
        if (concurrent) {
            hopts.sessionInfo = [this]() { return RouterStatsToJSON(router->GetStats()); };
        }
        auto factory = [hopts](const std::string&) -> std::shared_ptr<IProtocolHandler> {
            return std::make_shared<ProtocolHandler>(hopts);
        };
        handlers = std::make_shared<HandlerPool>(factory, concurrent ? config.maxConcurrentConnections : 1, !concurrent);

        RouterOptions ropts;
        ropts.maxSessions = concurrent ? config.maxConcurrentConnections : 0;
        ropts.sessionTimeout = config.sessionTimeoutMs;
        ropts.compatFailOpen = config.compatFailOpen;
        router = std::make_unique<RequestRouter>(ropts, handlers, workers);

        HTTPServer::Options sopts;
        sopts.address = config.address;
        sopts.port = std::to_string(config.port);
        sopts.scheme = config.scheme;
        sopts.certFile = config.certFile;
        sopts.keyFile = config.keyFile;
        sopts.ioThreads = config.ioThreads;
        sopts.apiKey = config.apiKey;
        http = std::make_unique<HTTPServer>(sopts);

        LOG_INFO("Vault server configured: vault={} mode={} maxConnections={} readOnly={} auth={}",
                 config.vaultPath, concurrent ? "concurrent" : "single-handler", config.maxConcurrentConnections,
                 config.readOnly, config.apiKey.empty() ? "off" : "api-key");
    }

    HttpReply handlePost(const HttpRequest& request) {
        const auto sid = request.Header(SESSION_HEADER);

        JSONValue doc;
        try {
            doc = ParseJSON(request.body);
        } catch (const std::exception& e) {
            LOG_WARN("Rejected malformed JSON-RPC body: {}", e.what());
            return rpcReply(400, *CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error"));
        }
        if (!doc.IsObject()) {
            return rpcReply(400, *CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
        }

        if (doc.Find("id") == nullptr) {
            JSONRPCNotification note;
            if (!note.FromJSON(doc)) {
                return rpcReply(400, *CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
            }
            auto routed = router->HandleNotification(sid, note);
            HttpReply reply;
            reply.status = routed.httpStatus;
            if (routed.sessionId.has_value()) {
                reply.headers.emplace_back(SESSION_HEADER, routed.sessionId.value());
            }
            return reply;
        }

        JSONRPCRequest rpc;
        if (!rpc.FromJSON(doc)) {
            return rpcReply(400, *CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
        }
        auto routed = router->HandlePost(sid, rpc);
        LOG_DEBUG("POST /mcp {} -> {} via {}", rpc.method, routed.httpStatus, ToString(routed.path));
        HttpReply reply;
        reply.status = routed.httpStatus;
        if (routed.response) {
            reply.body = routed.response->Serialize();
        }
        if (routed.sessionId.has_value()) {
            reply.headers.emplace_back(SESSION_HEADER, routed.sessionId.value());
        }
        return reply;
    }

    HttpReply handleDelete(const HttpRequest& request) {
        const auto sid = request.Header(SESSION_HEADER);
        if (!sid.has_value() || sid->empty()) {
            return errorReply(404, "Session not found");
        }
        if (router->DeleteSession(sid.value()) == DeleteOutcome::NotFound) {
            return errorReply(404, "Session not found");
        }
        JSONValue::Object o;
        o["message"] = str("Session closed");
        return jsonReply(200, std::move(o));
    }

    HttpReply describeEndpoint() {
        JSONValue::Object o;
        o["message"] = str("MCP endpoint active");
        o["usage"] = str("POST /mcp with MCP protocol messages");
        o["protocol"] = str("Model Context Protocol");
        o["transport"] = str("HTTP");
        o["sessionHeader"] = str(SESSION_HEADER);
        return jsonReply(200, std::move(o));
    }

    HttpReply health() {
        JSONValue::Object o;
        o["name"] = str(SERVER_NAME);
        o["version"] = str(getVersionString());
        o["status"] = str("running");
        o["vault"] = str(documents->Name());
        o["timestamp"] = str(isoTimestamp());
        return jsonReply(200, std::move(o));
    }

    HttpReply discovery() {
        const unsigned short port = http->BoundPort() != 0 ? http->BoundPort() : config.port;
        JSONValue::Object o;
        o["endpoint"] = str(fmt::format("{}://localhost:{}{}", config.scheme, port, MCP_ENDPOINT));
        o["protocol"] = str(config.scheme);
        o["method"] = str("POST");
        o["contentType"] = str("application/json");
        return jsonReply(200, std::move(o));
    }

    HttpReply handle(const HttpRequest& request) {
        if (request.target == MCP_ENDPOINT) {
            if (request.method == "POST") {
                return handlePost(request);
            }
            if (request.method == "GET") {
                return describeEndpoint();
            }
            if (request.method == "DELETE") {
                return handleDelete(request);
            }
            return errorReply(405, "Method not allowed");
        }
        if (request.method == "GET" && request.target == "/") {
            return health();
        }
        if (request.method == "GET" && request.target == WELL_KNOWN_PATH) {
            return discovery();
        }
        return errorReply(404, "Not found");
    }

    void stop() {
        if (stopped.exchange(true)) {
            return;
        }
        if (started.load()) {
            http->Stop().get();
        }
        router->Shutdown();
        LOG_INFO("Vault server stopped");
    }
};

VaultServer::VaultServer(ServerConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {
    pImpl->http->SetRequestHandler([this](const HttpRequest& req) { return pImpl->handle(req); });
    pImpl->http->SetErrorHandler([](const std::string& err) { LOG_ERROR("{}", err); });
}

VaultServer::~VaultServer() {
    pImpl->stop();
}

void VaultServer::Start() {
    FUNC_SCOPE();
    pImpl->http->Start().get();
    pImpl->started.store(true);
    pImpl->router->StartIdleSweep(pImpl->config.sweepIntervalMs);
    LOG_INFO("{} {} ready at {}://{}:{}{}", SERVER_NAME, getVersionString(), pImpl->config.scheme,
             pImpl->config.address, pImpl->http->BoundPort(), MCP_ENDPOINT);
}

void VaultServer::Stop() {
    FUNC_SCOPE();
    pImpl->stop();
}

HttpReply VaultServer::HandleHttp(const HttpRequest& request) {
    return pImpl->handle(request);
}

unsigned short VaultServer::BoundPort() const {
    return pImpl->http->BoundPort();
}

bool VaultServer::IsConcurrent() const {
    return pImpl->concurrent;
}

RequestRouter& VaultServer::Router() {
    return *pImpl->router;
}

const ServerConfig& VaultServer::Config() const {
    return pImpl->config;
}

} // namespace vaultmcp
