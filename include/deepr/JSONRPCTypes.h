//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: JSONRPCTypes.h
// Purpose: JSON value model and the JSON-RPC 2.0 Message envelope shared by every Deepr transport.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace deepr {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Equality is deep: arrays compare element-wise, objects compare by key set and member values.
//   An integer and a double never compare equal, even when numerically identical.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON when the input is not a single well-formed JSON document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    explicit JSONParseError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document (surrounding whitespace allowed, trailing content rejected).
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Compact JSON text for a value. Total: non-finite doubles are written as null.
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

// Member lookup helpers; all return empty when v is not an object or the member has another type.
const JSONValue* FindMember(const JSONValue& v, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& v, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& v, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& v, const std::string& key);

// Shorthand for building object members.
inline void SetMember(JSONValue::Object& o, const std::string& key, JSONValue v) {
    o[key] = std::make_shared<JSONValue>(std::move(v));
}

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string JSONRPCIdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus MCP-specific codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // MCP specific error codes
    constexpr int InvalidRequestId = -32000;
    constexpr int MethodNotAllowed = -32001;
    constexpr int ResourceNotFound = -32002;
    constexpr int ToolNotFound = -32003;
    constexpr int PromptNotFound = -32004;
}

//==========================================================================================================
// Message
// Purpose: One JSON-RPC 2.0 envelope. Exactly one of IsRequest/IsNotification/IsResponse holds for a
//          Message produced by DecodeMessage or by the factory helpers below.
// Fields:
//   jsonrpc: Always "2.0".
//   id: Absent for notifications. Present (possibly null) for requests and responses.
//   method: Set on requests and notifications only.
//   params: Optional payload of a request or notification.
//   result / error: Mutually exclusive; one of them is set on responses.
//==========================================================================================================
struct Message {
    std::string jsonrpc = "2.0";
    std::optional<JSONRPCId> id;
    std::optional<std::string> method;
    std::optional<JSONValue> params;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    // method and a non-null id
    bool IsRequest() const;
    // method without an id (or with a null id, which cannot be answered)
    bool IsNotification() const;
    // result or error, with an id (null allowed for errors that cannot be correlated)
    bool IsResponse() const;

    bool IsError() const { return error.has_value(); }
    std::optional<int64_t> ErrorCode() const;
    std::optional<std::string> ErrorMessage() const;

    static Message Request(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt);
    static Message Notification(std::string method, std::optional<JSONValue> params = std::nullopt);
    static Message Response(JSONRPCId id, JSONValue result);
    static Message ErrorResponse(JSONRPCId id, int code, const std::string& message,
                                 const std::optional<JSONValue>& data = std::nullopt);
};

bool operator==(const Message& a, const Message& b);
inline bool operator!=(const Message& a, const Message& b) { return !(a == b); }

//==========================================================================================================
// MessageDecodeError
// Purpose: Typed decode failure carrying the JSON-RPC code a peer should be answered with.
//   ParseError (-32700): bytes are not a well-formed JSON object.
//   InvalidRequest (-32600): well-formed object that is not a request, notification, or response.
//==========================================================================================================
class MessageDecodeError : public std::runtime_error {
public:
    MessageDecodeError(int code, const std::string& what) : std::runtime_error(what), code_(code) {}
    int Code() const noexcept { return code_; }
private:
    int code_;
};

//==========================================================================================================
// EncodeMessage / DecodeMessage
// Purpose: Wire codec for Message. EncodeMessage is total; DecodeMessage(EncodeMessage(m)) == m for any
//          valid Message m.
// Throws:
//   DecodeMessage throws MessageDecodeError.
//==========================================================================================================
std::string EncodeMessage(const Message& message);
Message DecodeMessage(const std::string& bytes);

// Converts an already-parsed JSON object into a Message, applying the same validation as DecodeMessage.
Message MessageFromJSON(const JSONValue& value);
JSONValue MessageToJSON(const Message& message);

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

} // namespace deepr
