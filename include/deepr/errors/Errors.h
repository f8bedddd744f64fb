//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Errors.h
// Purpose: Typed error structures, handler exceptions, and JSON-RPC error mapping helpers.
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "deepr/JSONRPCTypes.h"

namespace deepr {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error representation of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a response Message if it carries an error.
inline std::optional<McpError> mcpErrorFromMessage(const Message& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: error response Message for the given id.
inline Message makeErrorMessage(const JSONRPCId& id, const McpError& err) {
    return Message::ErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// RpcError
// Purpose: Exception a method handler throws to answer with a specific JSON-RPC error code instead of
//          the generic internal error.
//==========================================================================================================
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int Code() const noexcept { return code_; }
    const std::optional<JSONValue>& Data() const noexcept { return data_; }

    McpError ToMcpError() const {
        return McpError{code_, what(), data_, errorCategoryFromCode(code_)};
    }

private:
    int code_;
    std::optional<JSONValue> data_;
};

//==========================================================================================================
// TransportError
// Purpose: Client-side transport failure propagated to the caller.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        NotConnected,
        SessionClosed,
        Network,
        Protocol
    };

    TransportError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
    Kind GetKind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace errors
} // namespace deepr
