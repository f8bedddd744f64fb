//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Sampling.h
// Purpose: Typed shapes for server-initiated "ask the human" sampling/createMessage exchanges
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "deepr/JSONRPCTypes.h"

namespace deepr {
namespace typed {

constexpr const char* kCreateMessageMethod = "sampling/createMessage";

// Why the server is asking for human input.
enum class SamplingReason {
    Captcha,
    Paywall,
    LoginRequired,
    RateLimited,
    Confirmation
};

// Wire names: "captcha", "paywall", "login_required", "rate_limited", "confirmation".
const char* ToString(SamplingReason reason);
std::optional<SamplingReason> SamplingReasonFromString(const std::string& s);

//==========================================================================================================
// SamplingRequest
// Purpose: One request for human input.
// Fields:
//   reason: Category of the interruption.
//   prompt: Text shown to the human.
//   url: Source that triggered the request, when there is one.
//   context: Extra metadata merged into the wire metadata (an object; other values are ignored).
//   maxTokens: Upper bound on the reply size.
//==========================================================================================================
struct SamplingRequest {
    SamplingReason reason{SamplingReason::Confirmation};
    std::string prompt;
    std::optional<std::string> url;
    JSONValue context{JSONValue::Object{}};
    int64_t maxTokens{1024};

    //==========================================================================================================
    // ToWireParams
    // Returns:
    //   { messages: [{ role: "user", content: { type: "text", text: prompt } }],
    //     maxTokens, metadata: { reason, url (null when absent), ...context } }
    //==========================================================================================================
    JSONValue ToWireParams() const;
};

//==========================================================================================================
// SamplingResponse
// Purpose: The human's reply.
//==========================================================================================================
struct SamplingResponse {
    std::string content;
    bool approved{true};
    JSONValue metadata{JSONValue::Object{}};

    //==========================================================================================================
    // FromWireResult
    // Purpose: Parses a sampling/createMessage result. content may be a { type, text } block or a raw string;
    //          approved is false exactly when stopReason == "cancelled".
    //==========================================================================================================
    static SamplingResponse FromWireResult(const JSONValue& result);
};

SamplingRequest CreateCaptchaRequest(const std::string& url, const std::string& description = "");
SamplingRequest CreatePaywallRequest(const std::string& url, const std::string& title = "");
SamplingRequest CreateConfirmationRequest(const std::string& action, const std::string& details = "");

// Request Message carrying the sampling/createMessage call.
Message MakeSamplingMessage(const JSONRPCId& id, const SamplingRequest& request);

//==========================================================================================================
// SamplingResultBuilder
// Purpose: Chainable helper to construct a sampling/createMessage result, e.g. for clients and tests.
//
// Usage:
//   JSONValue v = SamplingResultBuilder()
//                   .setModel("m")
//                   .setRole("assistant")
//                   .addText("hello")
//                   .setStopReason("endTurn")
//                   .build();
//
// Returns:
//   build() yields { model, role, content, stopReason? }. A single text item is emitted as an object;
//   several items as an array.
//==========================================================================================================
class SamplingResultBuilder {
public:
    SamplingResultBuilder& setModel(const std::string& m) { model = m; return *this; }
    SamplingResultBuilder& setRole(const std::string& r) { role = r; return *this; }
    SamplingResultBuilder& setStopReason(const std::string& r) { stopReason = r; return *this; }
    SamplingResultBuilder& addText(const std::string& text);
    JSONValue build() const;

private:
    std::string model;
    std::string role{"assistant"};
    std::optional<std::string> stopReason;
    JSONValue::Array contents;
};

} // namespace typed
} // namespace deepr
