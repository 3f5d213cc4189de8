/**
 * @file OllamaNarrativeAdapter.cpp
 * @brief Implementation of OllamaNarrativeAdapter.
 */

#include "infrastructure/OllamaNarrativeAdapter.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <iostream>

namespace equilibra::infrastructure {

namespace {

const char* kExplainSystemPrompt =
    "You explain the output of a health trade-off engine to its user. "
    "The decision is final; never suggest different actions. "
    "Answer with a JSON object with exactly these string keys: "
    "\"explanation\" (2-3 sentences on what was decided and why), "
    "\"temporal_analysis\" (how today's choices affect the next days), "
    "\"context_assessment\" (one sentence on the person's current state).";

const char* kWeeklySystemPrompt =
    "You summarize a weekly adherence report for a health planning tool in "
    "at most four plain sentences. Do not invent numbers.";

} // namespace

OllamaNarrativeAdapter::OllamaNarrativeAdapter(std::shared_ptr<domain::NarrativeService> fallback,
                                               std::unique_ptr<OllamaClient> client,
                                               std::string model)
    : m_fallback(std::move(fallback)), m_client(std::move(client)), m_model(std::move(model)) {}

std::optional<domain::DecisionNarrative> OllamaNarrativeAdapter::ParseNarrative(const std::string& raw) {
    try {
        auto j = json::parse(raw);
        if (!j.is_object() || !j.contains("explanation") || !j["explanation"].is_string()) {
            return std::nullopt;
        }
        domain::DecisionNarrative n;
        n.explanation = j["explanation"].get<std::string>();
        if (n.explanation.empty()) return std::nullopt;
        if (j.contains("temporal_analysis") && j["temporal_analysis"].is_string()) {
            n.temporalAnalysis = j["temporal_analysis"].get<std::string>();
        }
        if (j.contains("context_assessment") && j["context_assessment"].is_string()) {
            n.contextAssessment = j["context_assessment"].get<std::string>();
        }
        n.generatedByModel = true;
        return n;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaNarrativeAdapter] Unparseable model output: " << e.what() << std::endl;
        return std::nullopt;
    }
}

domain::DecisionNarrative OllamaNarrativeAdapter::explainDecision(const domain::TradeOffDecision& decision) {
    json facts = {
        {"state", decision.state},
        {"constraints_active", json(decision).at("constraints_active")},
        {"decisions", decision.decisions},
        {"future_impacts", decision.futureImpacts},
        {"confidence_score", decision.confidenceScore},
        {"summary", decision.reasoningSummary}
    };

    auto raw = m_client->generate(m_model, kExplainSystemPrompt, DumpJson(facts), true);
    if (raw) {
        if (auto narrative = ParseNarrative(*raw)) {
            return *narrative;
        }
    }

    ++m_fallbacks;
    std::cerr << "[OllamaNarrativeAdapter] Falling back to " << m_fallback->name() << " narrative" << std::endl;
    return m_fallback->explainDecision(decision);
}

std::string OllamaNarrativeAdapter::weeklyInsight(const domain::WeeklyAdjustmentReport& report) {
    json facts = report;
    auto raw = m_client->generate(m_model, kWeeklySystemPrompt, DumpJson(facts), false);
    if (raw && !raw->empty()) {
        return *raw;
    }

    ++m_fallbacks;
    std::cerr << "[OllamaNarrativeAdapter] Falling back to " << m_fallback->name() << " weekly insight" << std::endl;
    return m_fallback->weeklyInsight(report);
}

} // namespace equilibra::infrastructure
