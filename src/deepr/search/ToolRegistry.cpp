//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: ToolRegistry.cpp
// Purpose: ToolSchema and ToolRegistry implementation
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "deepr/search/ToolRegistry.h"
#include "logging/Logger.h"

namespace deepr {
namespace search {

ToolSchema::ToolSchema(std::string name,
                       std::string description,
                       JSONValue inputSchema,
                       std::string category,
                       std::string costTier)
    : name_(std::move(name)),
      description_(std::move(description)),
      inputSchema_(std::move(inputSchema)),
      category_(std::move(category)),
      costTier_(std::move(costTier)) {
    if (name_.empty()) {
        throw std::invalid_argument("ToolSchema: name must not be empty");
    }
    tokens_ = Tokenize(name_ + " " + description_ + " " + category_);
}

JSONValue ToolSchema::ToMcpFormat() const {
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(name_));
    SetMember(o, "description", JSONValue(description_));
    SetMember(o, "inputSchema", inputSchema_);
    return JSONValue(std::move(o));
}

void ToolRegistry::insertLocked(ToolSchema&& tool) {
    const std::string name = tool.Name();
    if (tools_.find(name) == tools_.end()) {
        order_.push_back(name);
    }
    tools_[name] = std::make_shared<const ToolSchema>(std::move(tool));
}

void ToolRegistry::rebuildIndexLocked() {
    std::vector<std::vector<std::string>> corpus;
    corpus.reserve(order_.size());
    for (const auto& name : order_) {
        corpus.push_back(tools_.at(name)->Tokens());
    }
    index_.Fit(corpus);
}

void ToolRegistry::Register(ToolSchema tool) {
    std::lock_guard<std::mutex> lk(mutex_);
    LOG_DEBUG("ToolRegistry: register {}", tool.Name());
    insertLocked(std::move(tool));
    rebuildIndexLocked();
}

void ToolRegistry::RegisterMany(std::vector<ToolSchema> tools) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& tool : tools) {
        insertLocked(std::move(tool));
    }
    rebuildIndexLocked();
    LOG_DEBUG("ToolRegistry: registered {} tools (total {})", tools.size(), tools_.size());
}

ToolPtr ToolRegistry::Get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

std::vector<std::pair<ToolPtr, double>> ToolRegistry::SearchWithScores(const std::string& query,
                                                                       std::size_t limit) const {
    std::vector<std::pair<ToolPtr, double>> ranked;
    const std::vector<std::string> queryTokens = Tokenize(query);
    if (queryTokens.empty() || limit == 0) {
        return ranked;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (order_.empty()) {
        return ranked;
    }
    const std::vector<double> scores = index_.GetScores(queryTokens);
    for (std::size_t i = 0; i < order_.size() && i < scores.size(); ++i) {
        if (scores[i] > 0.0) {
            ranked.emplace_back(tools_.at(order_[i]), scores[i]);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

std::vector<ToolPtr> ToolRegistry::Search(const std::string& query, std::size_t limit) const {
    std::vector<ToolPtr> out;
    for (auto& [tool, score] : SearchWithScores(query, limit)) {
        out.push_back(std::move(tool));
    }
    return out;
}

std::vector<ToolPtr> ToolRegistry::AllTools() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<ToolPtr> out;
    out.reserve(order_.size());
    for (const auto& name : order_) {
        out.push_back(tools_.at(name));
    }
    return out;
}

std::size_t ToolRegistry::Count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return tools_.size();
}

std::size_t ToolRegistry::EstimateTokens() const {
    return EstimateTokens(AllTools());
}

std::size_t ToolRegistry::EstimateTokens(const std::vector<ToolPtr>& tools) {
    std::size_t totalChars = 0;
    for (const auto& tool : tools) {
        if (!tool) continue;
        totalChars += tool->Name().size();
        totalChars += tool->Description().size();
        totalChars += SerializeJSONValue(tool->InputSchema()).size();
    }
    return totalChars / 4;
}

} // namespace search
} // namespace deepr
