/**
 * @file DecisionCycleService.cpp
 * @brief Implementation of DecisionCycleService.
 */

#include "application/DecisionCycleService.hpp"
#include "domain/services/BurnoutPredictor.hpp"
#include "domain/services/ConstraintEvaluator.hpp"
#include "domain/services/TradeOffEngine.hpp"
#include <algorithm>
#include <iostream>

namespace equilibra::application {

using namespace equilibra::domain;
using namespace equilibra::domain::services;

DecisionCycleService::DecisionCycleService(std::shared_ptr<HistoryRepository> repository,
                                           std::shared_ptr<NarrativeService> narrative,
                                           std::shared_ptr<infrastructure::DecisionLogStore> logStore,
                                           int patternWindowDays)
    : m_repository(std::move(repository)),
      m_narrative(std::move(narrative)),
      m_logStore(std::move(logStore)),
      m_adjuster(patternWindowDays) {}

CycleResult DecisionCycleService::RunCycle(const StateSnapshot& state,
                                           const std::vector<PlannedTask>& plannedTasks,
                                           bool narrate,
                                           std::chrono::system_clock::time_point now) {
    CycleResult result;
    {
        std::lock_guard<std::mutex> lock(m_cycleMutex);
        const UserProfile profile = m_repository->getProfile();

        // Callers sample the clock before taking the lock; never append out of order.
        const auto history = m_repository->getHistory();
        if (!history.empty() && now < history.back().timestamp) {
            now = history.back().timestamp;
        }

        result.constraints = ConstraintEvaluator::evaluate(state, profile.thresholds);
        TradeOffEngine engine(profile.preferences);
        result.decision = engine.decide(state, result.constraints, plannedTasks, now);
        m_repository->appendDecision(result.decision);
    }

    std::cout << "[DecisionCycleService] Decision " << result.decision.id << ": "
              << result.constraints.size() << " constraints, confidence "
              << result.decision.confidenceScore << std::endl;

    if (narrate && m_narrative) {
        result.narrative = m_narrative->explainDecision(result.decision);
    }
    if (m_logStore) {
        m_logStore->logDecision(result.decision, result.narrative);
    }
    return result;
}

ConsensusDecision DecisionCycleService::ConsultCouncil(const StateSnapshot& state,
                                                       const std::string& activity,
                                                       const std::string& goal,
                                                       EvaluationMode mode) {
    const std::string effectiveGoal = goal.empty() ? m_repository->getProfile().primaryGoal : goal;
    auto consensus = m_council.deliberate(state.clamped(), activity, effectiveGoal, m_repository->getHistory(), mode);
    std::cout << "[DecisionCycleService] Council on '" << activity << "': "
              << CouncilActionToString(consensus.finalAction) << " ("
              << static_cast<int>(consensus.consensusLevel * 100.0 + 0.5) << "%)" << std::endl;
    return consensus;
}

BurnoutForecast DecisionCycleService::ForecastBurnout(std::chrono::system_clock::time_point now) {
    return BurnoutPredictor::predict(m_repository->getHistory(), now);
}

PlanAdjustment DecisionCycleService::AdjustPlan(const TradeOffDecision& current,
                                                const std::vector<PlannedTask>& upcoming,
                                                std::chrono::system_clock::time_point now) {
    PlanAdjustment adjustment;
    {
        std::lock_guard<std::mutex> lock(m_cycleMutex);
        adjustment = m_adjuster.adjustFuturePlan(current, upcoming, m_repository->getHistory(), now);
        m_repository->appendAdaptations(adjustment.adaptations);
    }
    if (m_logStore && !adjustment.adaptations.empty()) {
        m_logStore->logAdaptations(adjustment.adaptations);
    }
    if (!adjustment.adaptations.empty()) {
        std::cout << "[DecisionCycleService] " << adjustment.adaptations.size()
                  << " plan adaptation(s) recorded" << std::endl;
    }
    return adjustment;
}

WeeklyAdjustmentReport DecisionCycleService::WeeklyReport(std::chrono::system_clock::time_point now) {
    const int adaptations = static_cast<int>(m_repository->getAdaptations().size());
    return m_adjuster.weeklyReport(m_repository->getHistory(), adaptations, now);
}

std::string DecisionCycleService::WeeklyInsight(std::chrono::system_clock::time_point now) {
    if (!m_narrative) return {};
    return m_narrative->weeklyInsight(WeeklyReport(now));
}

DecisionStatistics DecisionCycleService::Statistics() {
    return ComputeStatistics(m_repository->getHistory());
}

DecisionStatistics DecisionCycleService::ComputeStatistics(const std::vector<TradeOffDecision>& history) {
    DecisionStatistics stats;
    stats.totalDecisions = static_cast<int>(history.size());

    std::map<std::string, int> constraintCounts;
    for (const auto& entry : history) {
        for (const auto& d : entry.decisions) {
            const std::string action = ActionToString(d.action);
            stats.actionDistribution[action]++;
            stats.categoryBreakdown[d.category][action]++;
        }
        for (auto kind : entry.activeConstraints) {
            constraintCounts[ConstraintKindToString(kind)]++;
        }
    }

    stats.topConstraints.assign(constraintCounts.begin(), constraintCounts.end());
    // Map order already sorts names, so stable_sort keeps ties alphabetical.
    std::stable_sort(stats.topConstraints.begin(), stats.topConstraints.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (stats.topConstraints.size() > 5) {
        stats.topConstraints.resize(5);
    }
    return stats;
}

std::string DecisionCycleService::NarrativeName() const {
    return m_narrative ? m_narrative->name() : "none";
}

} // namespace equilibra::application
