//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.cpp
// Purpose: MCP method dispatch, version negotiation and vault resources
//==========================================================================================================

#include <mutex>

#include "vaultmcp/ProtocolHandler.h"
#include "vaultmcp/errors/Errors.h"
#include "vaultmcp/version.h"
#include "logging/Logger.h"

namespace vaultmcp {

namespace {
constexpr const char* kInfoUri = "vault://info";
constexpr const char* kSessionInfoUri = "vault://session-info";

std::shared_ptr<JSONValue> make(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

JSONValue supportedVersionsValue() {
    JSONValue::Array arr;
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        arr.push_back(make(JSONValue{v}));
    }
    return JSONValue{std::move(arr)};
}
} // namespace

class ProtocolHandler::Impl {
public:
    ProtocolHandlerOptions options;
    mutable std::mutex stateMutex;
    bool initialized{false};
    bool clientReady{false};
    std::optional<std::string> negotiatedVersion;
    std::optional<Implementation> clientInfo;

    explicit Impl(ProtocolHandlerOptions opts) : options(std::move(opts)) {
        if (options.serverInfo.name.empty()) {
            options.serverInfo = Implementation(SERVER_NAME, getVersionString());
        }
    }

    bool isInitialized() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return initialized;
    }

    void markInitialized(const std::string& version) {
        std::lock_guard<std::mutex> lock(stateMutex);
        initialized = true;
        negotiatedVersion = version;
    }

    JSONValue serializeServerCapabilities() const {
        const auto& cfg = options.capabilities;
        JSONValue::Object caps;
        if (cfg.tools.has_value()) {
            JSONValue::Object toolsCap;
            toolsCap["listChanged"] = make(JSONValue{cfg.tools->listChanged});
            caps["tools"] = make(JSONValue{std::move(toolsCap)});
        }
        if (cfg.resources.has_value()) {
            JSONValue::Object resCap;
            resCap["subscribe"] = make(JSONValue{cfg.resources->subscribe});
            resCap["listChanged"] = make(JSONValue{cfg.resources->listChanged});
            caps["resources"] = make(JSONValue{std::move(resCap)});
        }
        return JSONValue{std::move(caps)};
    }

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        LOG_INFO("Handling initialize request");
        std::string version = PROTOCOL_VERSION;
        if (request.params.has_value()) {
            if (auto requested = request.params->GetString("protocolVersion")) {
                version = requested.value();
            }
            if (const JSONValue* ci = request.params->Find("clientInfo")) {
                std::lock_guard<std::mutex> lock(stateMutex);
                clientInfo = Implementation(ci->GetString("name").value_or(""), ci->GetString("version").value_or(""));
            }
        }
        if (!IsSupportedProtocolVersion(version)) {
            LOG_WARN("initialize requested unsupported protocol version '{}'", version);
            JSONValue::Object data;
            data["requested"] = make(JSONValue{version});
            data["supported"] = make(supportedVersionsValue());
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams,
                                       "Unsupported protocol version: " + version, JSONValue{std::move(data)});
        }
        markInitialized(version);

        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = make(JSONValue{version});
        resultObj["capabilities"] = make(serializeServerCapabilities());
        JSONValue::Object serverInfoObj;
        serverInfoObj["name"] = make(JSONValue{options.serverInfo.name});
        serverInfoObj["version"] = make(JSONValue{options.serverInfo.version});
        resultObj["serverInfo"] = make(JSONValue{std::move(serverInfoObj)});
        return CreateResultResponse(request.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        JSONValue::Array arr;
        if (options.invoker && options.invoker->Registry()) {
            for (const auto& t : options.invoker->Registry()->List()) {
                JSONValue::Object o;
                o["name"] = make(JSONValue{t.name});
                o["description"] = make(JSONValue{t.description});
                o["inputSchema"] = make(t.inputSchema);
                arr.push_back(make(JSONValue{std::move(o)}));
            }
        }
        JSONValue::Object resultObj;
        resultObj["tools"] = make(JSONValue{std::move(arr)});
        return CreateResultResponse(req.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req, const std::string& sessionId) {
        LOG_DEBUG("Handling tools/call request");
        std::string name;
        JSONValue arguments{JSONValue::Object{}};
        if (req.params.has_value()) {
            name = req.params->GetString("name").value_or("");
            if (const JSONValue* a = req.params->Find("arguments")) {
                arguments = *a;
            }
        }
        if (name.empty()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
        }
        if (!options.invoker) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + name);
        }
        WorkResult r = options.invoker->Invoke(sessionId, name, arguments);
        if (r.error.has_value()) {
            LOG_DEBUG("Tool {} failed with code {}: {}", name, r.error->code, r.error->message);
            return errors::makeErrorResponse(req.id, r.error.value());
        }
        const JSONValue value = r.value.value_or(JSONValue{});
        JSONValue::Object text;
        text["type"] = make(JSONValue{"text"});
        text["text"] = make(JSONValue{value.IsString() ? std::get<std::string>(value.value) : SerializeJSON(value)});
        JSONValue::Array content;
        content.push_back(make(JSONValue{std::move(text)}));
        JSONValue::Object resultObj;
        resultObj["content"] = make(JSONValue{std::move(content)});
        if (value.IsObject()) {
            resultObj["structuredContent"] = make(value);
        }
        resultObj["isError"] = make(JSONValue{false});
        return CreateResultResponse(req.id, JSONValue{std::move(resultObj)});
    }

    JSONValue makeResourceObj(const Resource& r) const {
        JSONValue::Object o;
        o["uri"] = make(JSONValue{r.uri});
        o["name"] = make(JSONValue{r.name});
        if (r.description.has_value()) {
            o["description"] = make(JSONValue{r.description.value()});
        }
        if (r.mimeType.has_value()) {
            o["mimeType"] = make(JSONValue{r.mimeType.value()});
        }
        return JSONValue{std::move(o)};
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling resources/list request");
        JSONValue::Array arr;
        arr.push_back(make(makeResourceObj(Resource(kInfoUri, "Vault Info", "Vault name, document count and access mode",
                                                    "application/json"))));
        if (options.sessionInfo) {
            arr.push_back(make(makeResourceObj(Resource(kSessionInfoUri, "Session Info",
                                                        "Active sessions, worker pool and handler pool statistics",
                                                        "application/json"))));
        }
        JSONValue::Object resultObj;
        resultObj["resources"] = make(JSONValue{std::move(arr)});
        return CreateResultResponse(req.id, JSONValue{std::move(resultObj)});
    }

    JSONValue vaultInfo() const {
        JSONValue::Object o;
        if (options.store) {
            o["name"] = make(JSONValue{options.store->Name()});
            o["documentCount"] = make(JSONValue{static_cast<int64_t>(options.store->CountDocuments())});
            o["readOnly"] = make(JSONValue{options.store->IsReadOnly()});
        }
        o["server"] = make(JSONValue{options.serverInfo.name});
        o["version"] = make(JSONValue{options.serverInfo.version});
        return JSONValue{std::move(o)};
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling resources/read request");
        std::string uri = req.params.has_value() ? req.params->GetString("uri").value_or("") : "";
        if (uri.empty()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing uri");
        }
        JSONValue body;
        if (uri == kInfoUri) {
            body = vaultInfo();
        } else if (uri == kSessionInfoUri && options.sessionInfo) {
            body = options.sessionInfo();
        } else {
            JSONValue::Object data;
            data["uri"] = make(JSONValue{uri});
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + uri,
                                       JSONValue{std::move(data)});
        }
        JSONValue::Object item;
        item["uri"] = make(JSONValue{uri});
        item["mimeType"] = make(JSONValue{"application/json"});
        item["text"] = make(JSONValue{SerializeJSON(body)});
        JSONValue::Array contents;
        contents.push_back(make(JSONValue{std::move(item)}));
        JSONValue::Object resultObj;
        resultObj["contents"] = make(JSONValue{std::move(contents)});
        return CreateResultResponse(req.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> notInitialized(const JSONRPCRequest& req, const std::string& sessionId) const {
        JSONValue::Object data;
        data["sessionId"] = make(JSONValue{sessionId});
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::NotInitialized, "Bad Request: Server not initialized",
                                   JSONValue{std::move(data)});
    }

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req, const std::string& sessionId) {
        try {
            if (req.method == Methods::Initialize) {
                return handleInitialize(req);
            }
            if (req.method == Methods::Ping) {
                return CreateResultResponse(req.id, JSONValue{JSONValue::Object{}});
            }
            if (!isInitialized()) {
                LOG_DEBUG("Rejecting {} before initialize (session {})", req.method, sessionId);
                return notInitialized(req, sessionId);
            }
            if (req.method == Methods::ListTools) {
                return handleToolsList(req);
            } else if (req.method == Methods::CallTool) {
                return handleToolsCall(req, sessionId);
            } else if (req.method == Methods::ListResources) {
                return handleResourcesList(req);
            } else if (req.method == Methods::ReadResource) {
                return handleResourcesRead(req);
            }
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        } catch (const errors::McpException& e) {
            return errors::makeErrorResponse(req.id, e.Error());
        } catch (const std::exception& e) {
            LOG_ERROR("Protocol handler exception for {}: {}", req.method, e.what());
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError,
                                       std::string("Internal error: ") + e.what());
        }
    }
};

ProtocolHandler::ProtocolHandler(ProtocolHandlerOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

ProtocolHandler::~ProtocolHandler() {
    FUNC_SCOPE();
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::HandleRequest(const JSONRPCRequest& req, const std::string& sessionId) {
    FUNC_SCOPE();
    return pImpl->dispatchRequest(req, sessionId);
}

void ProtocolHandler::HandleNotification(const JSONRPCNotification& note, const std::string& sessionId) {
    FUNC_SCOPE();
    if (note.method == Methods::Initialized) {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->clientReady = true;
        LOG_INFO("Client ready on session {}", sessionId);
        return;
    }
    LOG_DEBUG("Ignoring notification {} on session {}", note.method, sessionId);
}

bool ProtocolHandler::HandshakeInternally(const std::string& version) {
    FUNC_SCOPE();
    if (!IsSupportedProtocolVersion(version)) {
        LOG_DEBUG("Internal handshake rejected version '{}'", version);
        return false;
    }
    pImpl->markInitialized(version);
    return true;
}

bool ProtocolHandler::IsClientReady() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->clientReady;
}

bool ProtocolHandler::IsInitialized() const {
    return pImpl->isInitialized();
}

std::optional<std::string> ProtocolHandler::NegotiatedVersion() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->negotiatedVersion;
}

} // namespace vaultmcp
