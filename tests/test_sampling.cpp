//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_sampling.cpp
// Purpose: Human-in-the-loop sampling request/response shapes and result builder
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>

#include "deepr/typed/Sampling.h"

using namespace deepr;
using namespace deepr::typed;

TEST(SamplingReason, StringRoundTrip) {
    for (SamplingReason r : {SamplingReason::Captcha, SamplingReason::Paywall, SamplingReason::LoginRequired,
                             SamplingReason::RateLimited, SamplingReason::Confirmation}) {
        auto back = SamplingReasonFromString(ToString(r));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, r);
    }
    EXPECT_STREQ(ToString(SamplingReason::LoginRequired), "login_required");
    EXPECT_FALSE(SamplingReasonFromString("unknown").has_value());
}

TEST(SamplingRequest, CaptchaPromptAndWireShape) {
    SamplingRequest req = CreateCaptchaRequest("https://example.com/article", "Image grid challenge");
    EXPECT_EQ(req.reason, SamplingReason::Captcha);
    ASSERT_TRUE(req.url.has_value());
    EXPECT_EQ(*req.url, "https://example.com/article");
    EXPECT_NE(req.prompt.find("https://example.com/article"), std::string::npos);
    EXPECT_NE(req.prompt.find("Image grid challenge"), std::string::npos);
    EXPECT_NE(req.prompt.find("'skip'"), std::string::npos);

    JSONValue params = req.ToWireParams();
    EXPECT_EQ(GetIntMember(params, "maxTokens").value_or(0), 1024);
    const auto& messages = std::get<JSONValue::Array>(FindMember(params, "messages")->value);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(GetStringMember(*messages[0], "role").value_or(""), "user");
    const JSONValue* content = FindMember(*messages[0], "content");
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(GetStringMember(*content, "type").value_or(""), "text");
    EXPECT_EQ(GetStringMember(*content, "text").value_or(""), req.prompt);

    const JSONValue* metadata = FindMember(params, "metadata");
    ASSERT_NE(metadata, nullptr);
    EXPECT_EQ(GetStringMember(*metadata, "reason").value_or(""), "captcha");
    EXPECT_EQ(GetStringMember(*metadata, "url").value_or(""), "https://example.com/article");
}

TEST(SamplingRequest, PaywallCarriesTitleInMetadata) {
    SamplingRequest req = CreatePaywallRequest("https://news.test/story", "Markets Today");
    EXPECT_EQ(req.reason, SamplingReason::Paywall);
    EXPECT_NE(req.prompt.find("Title: Markets Today"), std::string::npos);
    JSONValue metadata = *FindMember(req.ToWireParams(), "metadata");
    EXPECT_EQ(GetStringMember(metadata, "reason").value_or(""), "paywall");
    EXPECT_EQ(GetStringMember(metadata, "title").value_or(""), "Markets Today");
}

TEST(SamplingRequest, ConfirmationHasNullUrl) {
    SamplingRequest req = CreateConfirmationRequest("Spend $5 on research", "Budget remaining: $10");
    EXPECT_EQ(req.reason, SamplingReason::Confirmation);
    EXPECT_FALSE(req.url.has_value());
    EXPECT_NE(req.prompt.find("Action: Spend $5 on research"), std::string::npos);
    EXPECT_NE(req.prompt.find("'yes'"), std::string::npos);

    JSONValue metadata = *FindMember(req.ToWireParams(), "metadata");
    const JSONValue* url = FindMember(metadata, "url");
    ASSERT_NE(url, nullptr);
    EXPECT_TRUE(url->IsNull());
}

TEST(SamplingRequest, MessageIsCreateMessageRequest) {
    Message m = MakeSamplingMessage(int64_t{9}, CreateConfirmationRequest("delete cache"));
    EXPECT_TRUE(m.IsRequest());
    EXPECT_EQ(m.method.value_or(""), "sampling/createMessage");
    ASSERT_TRUE(m.params.has_value());
    EXPECT_NE(FindMember(*m.params, "messages"), nullptr);
}

TEST(SamplingResponse, ParsesApprovedTextResult) {
    JSONValue result = SamplingResultBuilder().setModel("human").addText("captcha: 7XK2").setStopReason("endTurn").build();
    SamplingResponse r = SamplingResponse::FromWireResult(result);
    EXPECT_EQ(r.content, "captcha: 7XK2");
    EXPECT_TRUE(r.approved);
    EXPECT_TRUE(r.metadata.IsObject());
}

TEST(SamplingResponse, CancelledStopReasonMeansDenied) {
    JSONValue result = SamplingResultBuilder().addText("no").setStopReason("cancelled").build();
    EXPECT_FALSE(SamplingResponse::FromWireResult(result).approved);
}

TEST(SamplingResponse, MissingContentAndMetadataPassThrough) {
    JSONValue::Object meta;
    SetMember(meta, "source", JSONValue("client"));
    JSONValue::Object o;
    SetMember(o, "metadata", JSONValue(meta));
    SamplingResponse r = SamplingResponse::FromWireResult(JSONValue(o));
    EXPECT_TRUE(r.content.empty());
    EXPECT_TRUE(r.approved);
    EXPECT_EQ(GetStringMember(r.metadata, "source").value_or(""), "client");
}

TEST(SamplingResultBuilder, MultipleTextBlocksBecomeArray) {
    JSONValue result = SamplingResultBuilder().setModel("m").setRole("assistant").addText("a").addText("b").build();
    EXPECT_EQ(GetStringMember(result, "model").value_or(""), "m");
    EXPECT_EQ(GetStringMember(result, "role").value_or(""), "assistant");
    const JSONValue* content = FindMember(result, "content");
    ASSERT_NE(content, nullptr);
    ASSERT_TRUE(content->IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(content->value).size(), 2u);
    EXPECT_EQ(FindMember(result, "stopReason"), nullptr);
}
