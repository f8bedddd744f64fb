//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Sampling.cpp
// Purpose: Sampling request/response wire conversion and factories
//==========================================================================================================

#include "deepr/typed/Sampling.h"

namespace deepr {
namespace typed {

namespace {

JSONValue textBlock(const std::string& text) {
    JSONValue::Object t;
    SetMember(t, "type", JSONValue(std::string("text")));
    SetMember(t, "text", JSONValue(text));
    return JSONValue(std::move(t));
}

} // namespace

const char* ToString(SamplingReason reason) {
    switch (reason) {
        case SamplingReason::Captcha: return "captcha";
        case SamplingReason::Paywall: return "paywall";
        case SamplingReason::LoginRequired: return "login_required";
        case SamplingReason::RateLimited: return "rate_limited";
        case SamplingReason::Confirmation: return "confirmation";
    }
    return "confirmation";
}

std::optional<SamplingReason> SamplingReasonFromString(const std::string& s) {
    if (s == "captcha") return SamplingReason::Captcha;
    if (s == "paywall") return SamplingReason::Paywall;
    if (s == "login_required") return SamplingReason::LoginRequired;
    if (s == "rate_limited") return SamplingReason::RateLimited;
    if (s == "confirmation") return SamplingReason::Confirmation;
    return std::nullopt;
}

JSONValue SamplingRequest::ToWireParams() const {
    JSONValue::Object message;
    SetMember(message, "role", JSONValue(std::string("user")));
    SetMember(message, "content", textBlock(prompt));

    JSONValue::Array messages;
    messages.push_back(std::make_shared<JSONValue>(JSONValue(std::move(message))));

    JSONValue::Object metadata;
    SetMember(metadata, "reason", JSONValue(std::string(ToString(reason))));
    SetMember(metadata, "url", url ? JSONValue(*url) : JSONValue(nullptr));
    if (const auto* ctx = std::get_if<JSONValue::Object>(&context.value)) {
        for (const auto& [key, val] : *ctx) {
            metadata[key] = val;
        }
    }

    JSONValue::Object params;
    SetMember(params, "messages", JSONValue(std::move(messages)));
    SetMember(params, "maxTokens", JSONValue(maxTokens));
    SetMember(params, "metadata", JSONValue(std::move(metadata)));
    return JSONValue(std::move(params));
}

SamplingResponse SamplingResponse::FromWireResult(const JSONValue& result) {
    SamplingResponse r;
    if (const JSONValue* content = FindMember(result, "content")) {
        if (content->IsObject()) {
            r.content = GetStringMember(*content, "text").value_or("");
        } else if (const auto* s = std::get_if<std::string>(&content->value)) {
            r.content = *s;
        } else if (!content->IsNull()) {
            r.content = SerializeJSONValue(*content);
        }
    }
    r.approved = GetStringMember(result, "stopReason").value_or("") != "cancelled";
    if (const JSONValue* metadata = FindMember(result, "metadata")) {
        if (metadata->IsObject()) {
            r.metadata = *metadata;
        }
    }
    return r;
}

SamplingRequest CreateCaptchaRequest(const std::string& url, const std::string& description) {
    SamplingRequest req;
    req.reason = SamplingReason::Captcha;
    req.prompt = "The research agent encountered a CAPTCHA at: " + url + "\n\n" +
                 description + "\n\n"
                 "Please solve the CAPTCHA and paste the result, "
                 "or type 'skip' to skip this source.";
    req.url = url;
    return req;
}

SamplingRequest CreatePaywallRequest(const std::string& url, const std::string& title) {
    SamplingRequest req;
    req.reason = SamplingReason::Paywall;
    req.prompt = "The research agent found a paywalled source:\n"
                 "  URL: " + url + "\n"
                 "  Title: " + title + "\n\n"
                 "Would you like to:\n"
                 "1. Skip this source\n"
                 "2. Provide access credentials\n"
                 "3. Paste the article content manually\n\n"
                 "Reply with your choice or the content.";
    req.url = url;
    JSONValue::Object ctx;
    SetMember(ctx, "title", JSONValue(title));
    req.context = JSONValue(std::move(ctx));
    return req;
}

SamplingRequest CreateConfirmationRequest(const std::string& action, const std::string& details) {
    SamplingRequest req;
    req.reason = SamplingReason::Confirmation;
    req.prompt = "The research agent wants to perform an action that requires confirmation:\n\n"
                 "Action: " + action + "\n" +
                 details + "\n\n"
                 "Reply 'yes' to approve or 'no' to deny.";
    return req;
}

Message MakeSamplingMessage(const JSONRPCId& id, const SamplingRequest& request) {
    return Message::Request(id, kCreateMessageMethod, request.ToWireParams());
}

SamplingResultBuilder& SamplingResultBuilder::addText(const std::string& text) {
    contents.push_back(std::make_shared<JSONValue>(textBlock(text)));
    return *this;
}

JSONValue SamplingResultBuilder::build() const {
    JSONValue::Object resultObj;
    SetMember(resultObj, "model", JSONValue(model));
    SetMember(resultObj, "role", JSONValue(role));
    if (contents.size() == 1) {
        SetMember(resultObj, "content", *contents.front());
    } else {
        SetMember(resultObj, "content", JSONValue(contents));
    }
    if (stopReason) {
        SetMember(resultObj, "stopReason", JSONValue(*stopReason));
    }
    return JSONValue(std::move(resultObj));
}

} // namespace typed
} // namespace deepr
