/**
 * @file NarrativeService.hpp
 * @brief Strategy interface for turning engine output into prose.
 */

#pragma once

#include <string>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"

namespace equilibra::domain {

/**
 * @struct DecisionNarrative
 * @brief Human-readable explanation of a decision.
 */
struct DecisionNarrative {
    std::string explanation;
    std::string temporalAnalysis;
    std::string contextAssessment;
    bool generatedByModel = false;   ///< False when the template path produced it.
};

/**
 * @class NarrativeService
 * @brief Describes decisions without ever changing them.
 *
 * Implementations must not throw; a failing service-backed strategy
 * falls back to a heuristic one.
 */
class NarrativeService {
public:
    virtual ~NarrativeService() = default;

    virtual DecisionNarrative explainDecision(const TradeOffDecision& decision) = 0;

    virtual std::string weeklyInsight(const WeeklyAdjustmentReport& report) = 0;

    /** @brief Short identifier shown in the dashboard ("template", "ollama:<model>"). */
    virtual std::string name() const = 0;
};

} // namespace equilibra::domain
