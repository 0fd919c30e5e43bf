//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and JSON-RPC error mapping helpers for the vault MCP server
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "vaultmcp/JSONRPCTypes.h"

namespace vaultmcp {
namespace errors {

// Groups error codes by how a client is expected to recover.
enum class ErrorCategory {
    Parse,          // malformed JSON or JSON-RPC envelope
    Request,        // invalid request, unknown method, bad params
    ProtocolState,  // wrong phase: not initialized, no active transport
    Capacity,       // worker queue full, worker timeout; retry later
    Transport,      // channel-level failure
    Internal,       // unexpected exception inside the server
    Application,    // tool or document store failure forwarded verbatim
    Unknown
};

// Typed error representation used across the router, worker pool and tool layer.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or server-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::Parse;
        case JSONRPCErrorCodes::InvalidRequest:
        case JSONRPCErrorCodes::MethodNotFound:
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::Request;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::Internal;
        case JSONRPCErrorCodes::NotInitialized:
        case JSONRPCErrorCodes::NoActiveTransport: return ErrorCategory::ProtocolState;
        case JSONRPCErrorCodes::WorkerTimeout:
        case JSONRPCErrorCodes::CapacityExceeded: return ErrorCategory::Capacity;
        case JSONRPCErrorCodes::ResourceNotFound:
        case JSONRPCErrorCodes::ToolNotFound:
        case JSONRPCErrorCodes::SecurityViolation:
        case JSONRPCErrorCodes::ToolExecutionFailed: return ErrorCategory::Application;
        default: return ErrorCategory::Unknown;
    }
}

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = errVal.GetInt("code");
    auto message = errVal.GetString("message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(code.value()), std::move(message.value()), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError; thrown by tool handlers and caught at the protocol
//          handler boundary, where it becomes a JSON-RPC error response with the same code.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), error(makeError(code, message, std::move(data))) {}

    const McpError& Error() const noexcept { return error; }

private:
    McpError error;
};

} // namespace errors
} // namespace vaultmcp
