//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: DefaultTools.cpp
// Purpose: Built-in Deepr tool descriptors
//==========================================================================================================

#include "deepr/search/ToolRegistry.h"

namespace deepr {
namespace search {

std::unique_ptr<ToolRegistry> CreateDefaultRegistry() {
    auto registry = std::make_unique<ToolRegistry>();
    std::vector<ToolSchema> tools;

    // Research tools
    tools.emplace_back(
        "deepr_research",
        "Submit a deep research job for comprehensive analysis requiring web search "
        "and synthesis. Returns job_id for async status tracking and resource URIs for "
        "subscriptions. Costs $0.10-$0.50. Do NOT use for simple factual lookups -- "
        "use web search instead. Example: deepr_research(prompt='Compare HIPAA vs GDPR "
        "data retention requirements')",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "prompt": {
                    "type": "string",
                    "description": "Research question or topic. Be specific (e.g., 'Impact of Basel III on crypto') rather than generic."
                },
                "model": {
                    "type": "string",
                    "default": "o4-mini-deep-research",
                    "description": "Model: o4-mini-deep-research ($0.15, fast), o3-deep-research ($0.50, premium)"
                },
                "provider": {
                    "type": "string",
                    "default": "openai",
                    "description": "Provider: openai, azure, gemini, grok"
                },
                "budget": {"type": "number", "description": "Maximum cost in dollars"},
                "enable_web_search": {"type": "boolean", "default": true}
            },
            "required": ["prompt"]
        })json"),
        "research",
        "medium");

    tools.emplace_back(
        "deepr_check_status",
        "Check progress of a research job. Returns phase, progress percentage, "
        "elapsed time, and cost so far. Prefer subscribing to "
        "deepr://campaigns/{id}/status for push updates instead of polling.",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "job_id": {"type": "string", "description": "Job ID from deepr_research or deepr_agentic_research"}
            },
            "required": ["job_id"]
        })json"),
        "research",
        "free");

    tools.emplace_back(
        "deepr_get_result",
        "Get results of a completed research job. Returns markdown report with "
        "citations, cost, and metadata. Only call after deepr_check_status confirms "
        "status is 'completed'. For large reports, returns summary + resource URI.",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "job_id": {"type": "string", "description": "Job ID from deepr_research"}
            },
            "required": ["job_id"]
        })json"),
        "research",
        "free");

    // Expert tools
    tools.emplace_back(
        "deepr_list_experts",
        "List all available domain experts with name, domain, document count, "
        "and conversation count. Use this before querying to find the right expert.",
        ParseJSON(R"json({"type": "object", "properties": {}})json"),
        "experts",
        "free");

    tools.emplace_back(
        "deepr_query_expert",
        "Query a domain expert with a question. Expert answers from their "
        "knowledge base with citations and confidence levels. For questions "
        "outside the expert's knowledge, enable agentic=true to let the expert "
        "trigger new research. Do NOT use for current events or news.",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "expert_name": {"type": "string", "description": "Name of the expert (from deepr_list_experts)"},
                "question": {"type": "string", "description": "Question to ask the expert"},
                "agentic": {"type": "boolean", "default": false, "description": "Enable autonomous research if expert lacks knowledge"},
                "budget": {"type": "number", "default": 0.0, "description": "Budget for agentic research (only used if agentic=true)"}
            },
            "required": ["expert_name", "question"]
        })json"),
        "experts",
        "low");

    tools.emplace_back(
        "deepr_get_expert_info",
        "Get detailed information about an expert including document count, "
        "conversation stats, knowledge gaps, and capabilities. Use to assess "
        "if an expert is suitable before querying.",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "expert_name": {"type": "string", "description": "Name of the expert"}
            },
            "required": ["expert_name"]
        })json"),
        "experts",
        "free");

    // Agentic tools
    tools.emplace_back(
        "deepr_agentic_research",
        "Start autonomous multi-step research workflow with Plan-Execute-Review "
        "cycles. An expert autonomously decomposes goals, conducts research, and "
        "synthesizes findings. Costs $1-$10. Requires an existing expert. "
        "Always confirm budget with user before calling. "
        "Example: deepr_agentic_research(goal='Evaluate database options for "
        "our recommendation engine', expert_name='Tech Architect', budget=5.0)",
        ParseJSON(R"json({
            "type": "object",
            "properties": {
                "goal": {"type": "string", "description": "High-level research goal. Be specific about the desired outcome."},
                "expert_name": {"type": "string", "description": "Expert to use for reasoning (required). See deepr_list_experts."},
                "budget": {"type": "number", "default": 5.0, "description": "Total budget for workflow ($1-$10)"}
            },
            "required": ["goal"]
        })json"),
        "agentic",
        "high");

    registry->RegisterMany(std::move(tools));
    return registry;
}

} // namespace search
} // namespace deepr
