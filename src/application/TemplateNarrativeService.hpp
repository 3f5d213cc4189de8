/**
 * @file TemplateNarrativeService.hpp
 * @brief Heuristic narrative strategy; the default and the fallback for model-backed ones.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/NarrativeService.hpp"

namespace equilibra::application {

class TemplateNarrativeService : public domain::NarrativeService {
public:
    domain::DecisionNarrative explainDecision(const domain::TradeOffDecision& decision) override;
    std::string weeklyInsight(const domain::WeeklyAdjustmentReport& report) override;
    std::string name() const override { return "template"; }

private:
    static std::string joinCategories(const domain::TradeOffDecision& decision, domain::DecisionAction action);
    static std::string temporalAnalysis(const domain::TradeOffDecision& decision);
    static std::string contextAssessment(const domain::TradeOffDecision& decision);
};

} // namespace equilibra::application
