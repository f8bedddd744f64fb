//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: ToolRegistry.h
// Purpose: Tool descriptors and the searchable registry behind tool discovery
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "deepr/JSONRPCTypes.h"
#include "deepr/search/BM25Index.h"

namespace deepr {
namespace search {

//==========================================================================================================
// ToolSchema
// Purpose: Immutable description of one callable tool.
// Fields:
//   name: Unique registry key.
//   description: Natural-language text used for ranking.
//   inputSchema: JSON Schema of the tool's arguments.
//   category: Grouping label ("research", "experts", ...). Defaults to "general".
//   costTier: "free", "low", "medium" or "high". Defaults to "free".
//   tokens: Tokenize(name + " " + description + " " + category), computed once at construction.
//==========================================================================================================
class ToolSchema {
public:
    ToolSchema(std::string name,
               std::string description,
               JSONValue inputSchema,
               std::string category = "general",
               std::string costTier = "free");

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const JSONValue& InputSchema() const { return inputSchema_; }
    const std::string& Category() const { return category_; }
    const std::string& CostTier() const { return costTier_; }
    const std::vector<std::string>& Tokens() const { return tokens_; }

    // { name, description, inputSchema }
    JSONValue ToMcpFormat() const;

private:
    std::string name_;
    std::string description_;
    JSONValue inputSchema_;
    std::string category_;
    std::string costTier_;
    std::vector<std::string> tokens_;
};

using ToolPtr = std::shared_ptr<const ToolSchema>;

//==========================================================================================================
// ToolRegistry
// Purpose: Name-keyed tool store that keeps a BM25 index aligned with insertion order.
// Notes:
//   - Register/RegisterMany insert or replace by name and rebuild the whole index.
//   - Replacing a tool keeps its original insertion position.
//   - Reads may run concurrently with each other and with registration.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void Register(ToolSchema tool);
    void RegisterMany(std::vector<ToolSchema> tools);

    // Returns nullptr when no tool has this name.
    ToolPtr Get(const std::string& name) const;

    //==========================================================================================================
    // Search
    // Purpose: Ranks every tool against the query and returns at most `limit` tools with a positive score,
    //          best first. Equal scores keep registry insertion order.
    //==========================================================================================================
    std::vector<ToolPtr> Search(const std::string& query, std::size_t limit = 3) const;
    std::vector<std::pair<ToolPtr, double>> SearchWithScores(const std::string& query, std::size_t limit = 3) const;

    // All tools in insertion order.
    std::vector<ToolPtr> AllTools() const;
    std::size_t Count() const;

    //==========================================================================================================
    // EstimateTokens
    // Purpose: Rough context cost: (chars of name + description + serialized inputSchema) / 4.
    //==========================================================================================================
    std::size_t EstimateTokens() const;
    static std::size_t EstimateTokens(const std::vector<ToolPtr>& tools);

private:
    void insertLocked(ToolSchema&& tool);
    void rebuildIndexLocked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolPtr> tools_;
    std::vector<std::string> order_;
    BM25Index index_;
};

//==========================================================================================================
// CreateDefaultRegistry
// Purpose: Registry populated with the built-in research, expert, and agentic tool descriptors.
//==========================================================================================================
std::unique_ptr<ToolRegistry> CreateDefaultRegistry();

} // namespace search
} // namespace deepr
