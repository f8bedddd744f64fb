//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: JSONRPCMessage.cpp
// Purpose: Message envelope classification, factories, and wire codec.
//==========================================================================================================

#include "deepr/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace deepr {

std::string JSONRPCIdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

bool Message::IsRequest() const {
    return method.has_value() && id.has_value() && !std::holds_alternative<std::nullptr_t>(*id);
}

bool Message::IsNotification() const {
    return method.has_value() && !IsRequest();
}

bool Message::IsResponse() const {
    return !method.has_value() && id.has_value() && (result.has_value() != error.has_value());
}

std::optional<int64_t> Message::ErrorCode() const {
    if (!error) return std::nullopt;
    return GetIntMember(*error, "code");
}

std::optional<std::string> Message::ErrorMessage() const {
    if (!error) return std::nullopt;
    return GetStringMember(*error, "message");
}

Message Message::Request(JSONRPCId id, std::string method, std::optional<JSONValue> params) {
    Message m;
    m.id = std::move(id);
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

Message Message::Notification(std::string method, std::optional<JSONValue> params) {
    Message m;
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

Message Message::Response(JSONRPCId id, JSONValue result) {
    Message m;
    m.id = std::move(id);
    m.result = std::move(result);
    return m;
}

Message Message::ErrorResponse(JSONRPCId id, int code, const std::string& message,
                               const std::optional<JSONValue>& data) {
    Message m;
    m.id = std::move(id);
    m.error = CreateErrorObject(code, message, data);
    return m;
}

bool operator==(const Message& a, const Message& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method &&
           a.params == b.params && a.result == b.result && a.error == b.error;
}

JSONValue MessageToJSON(const Message& message) {
    JSONValue::Object obj;
    SetMember(obj, "jsonrpc", JSONValue(message.jsonrpc));
    if (message.id.has_value()) {
        std::visit([&obj](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                SetMember(obj, "id", JSONValue(nullptr));
            } else {
                SetMember(obj, "id", JSONValue(v));
            }
        }, *message.id);
    }
    if (message.method) SetMember(obj, "method", JSONValue(*message.method));
    if (message.params) SetMember(obj, "params", *message.params);
    if (message.result) SetMember(obj, "result", *message.result);
    if (message.error) SetMember(obj, "error", *message.error);
    return JSONValue(std::move(obj));
}

Message MessageFromJSON(const JSONValue& value) {
    if (!value.IsObject()) {
        throw MessageDecodeError(JSONRPCErrorCodes::ParseError, "JSON-RPC message must be an object");
    }
    Message m;

    if (const JSONValue* v = FindMember(value, "jsonrpc")) {
        const auto* s = std::get_if<std::string>(&v->value);
        if (!s || *s != "2.0") {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "Unsupported jsonrpc version");
        }
    }

    if (const JSONValue* v = FindMember(value, "id")) {
        if (const auto* s = std::get_if<std::string>(&v->value)) {
            m.id = JSONRPCId(*s);
        } else if (const auto* n = std::get_if<int64_t>(&v->value)) {
            m.id = JSONRPCId(*n);
        } else if (v->IsNull()) {
            m.id = JSONRPCId(nullptr);
        } else {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "id must be a string, integer, or null");
        }
    }

    if (const JSONValue* v = FindMember(value, "method")) {
        const auto* s = std::get_if<std::string>(&v->value);
        if (!s) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "method must be a string");
        }
        m.method = *s;
    }
    if (const JSONValue* v = FindMember(value, "params")) m.params = *v;
    if (const JSONValue* v = FindMember(value, "result")) m.result = *v;
    if (const JSONValue* v = FindMember(value, "error")) {
        if (!GetIntMember(*v, "code").has_value() || !GetStringMember(*v, "message").has_value()) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "error must carry integer code and string message");
        }
        m.error = *v;
    }

    if (m.method.has_value()) {
        if (m.result || m.error) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "method cannot be combined with result or error");
        }
    } else {
        if (m.params) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "params without method");
        }
        if (m.result.has_value() == m.error.has_value()) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "response needs exactly one of result or error");
        }
        if (!m.id.has_value()) {
            throw MessageDecodeError(JSONRPCErrorCodes::InvalidRequest, "response without id");
        }
    }
    return m;
}

std::string EncodeMessage(const Message& message) {
    return SerializeJSONValue(MessageToJSON(message));
}

Message DecodeMessage(const std::string& bytes) {
    JSONValue parsed;
    try {
        parsed = ParseJSON(bytes);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("DecodeMessage: parse failure: {}", e.what());
        throw MessageDecodeError(JSONRPCErrorCodes::ParseError, e.what());
    }
    return MessageFromJSON(parsed);
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    SetMember(errorObj, "code", JSONValue(static_cast<int64_t>(code)));
    SetMember(errorObj, "message", JSONValue(message));
    if (data.has_value()) {
        SetMember(errorObj, "data", data.value());
    }
    return JSONValue(std::move(errorObj));
}

} // namespace deepr
