/**
 * @file OllamaNarrativeAdapter.hpp
 * @brief Narrative strategy backed by a local Ollama server, with heuristic fallback.
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "domain/NarrativeService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace equilibra::infrastructure {

/**
 * @class OllamaNarrativeAdapter
 * @brief Decorates another NarrativeService.
 *
 * The model only sees the decision's structured fields. Transport, HTTP
 * and parse failures all route to the fallback strategy; nothing is thrown.
 */
class OllamaNarrativeAdapter : public domain::NarrativeService {
public:
    OllamaNarrativeAdapter(std::shared_ptr<domain::NarrativeService> fallback,
                           std::unique_ptr<OllamaClient> client,
                           std::string model = "qwen2.5:7b");

    domain::DecisionNarrative explainDecision(const domain::TradeOffDecision& decision) override;
    std::string weeklyInsight(const domain::WeeklyAdjustmentReport& report) override;
    std::string name() const override { return "ollama:" + m_model; }

    /** @brief Parses the model's JSON answer; nullopt unless "explanation" is a non-empty string. */
    static std::optional<domain::DecisionNarrative> ParseNarrative(const std::string& raw);

    /** @brief Number of requests answered by the fallback strategy. */
    int fallbackCount() const { return m_fallbacks.load(); }

private:
    std::shared_ptr<domain::NarrativeService> m_fallback;
    std::unique_ptr<OllamaClient> m_client;
    std::string m_model;
    std::atomic<int> m_fallbacks{0};
};

} // namespace equilibra::infrastructure
