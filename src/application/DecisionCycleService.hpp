/**
 * @file DecisionCycleService.hpp
 * @brief Use-case orchestration around the trade-off engine.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/HistoryRepository.hpp"
#include "domain/NarrativeService.hpp"
#include "domain/services/HealthCouncil.hpp"
#include "domain/services/PlanAdjuster.hpp"
#include "infrastructure/DecisionLogStore.hpp"

namespace equilibra::application {

/**
 * @struct CycleResult
 * @brief Everything one decision cycle produced.
 */
struct CycleResult {
    domain::TradeOffDecision decision;
    domain::ActiveConstraints constraints;
    std::optional<domain::DecisionNarrative> narrative;
};

/**
 * @class DecisionCycleService
 * @brief state -> constraints -> decision -> append -> narrate.
 *
 * Cycles are serialized with a mutex so the history log has a single
 * writer. The narrative runs after the append and outside the lock; it
 * only describes the stored decision.
 */
class DecisionCycleService {
public:
    /**
     * @param logStore Optional audit log; may be null.
     * @param narrative Optional narrative strategy; may be null.
     */
    DecisionCycleService(std::shared_ptr<domain::HistoryRepository> repository,
                         std::shared_ptr<domain::NarrativeService> narrative,
                         std::shared_ptr<infrastructure::DecisionLogStore> logStore,
                         int patternWindowDays = 7);

    /** @brief Runs one full decision cycle using the stored profile's thresholds and preferences. */
    CycleResult RunCycle(const domain::StateSnapshot& state,
                         const std::vector<domain::PlannedTask>& plannedTasks,
                         bool narrate = true,
                         std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /** @brief Council arbitration for a single proposed activity against the stored history. */
    domain::ConsensusDecision ConsultCouncil(const domain::StateSnapshot& state,
                                             const std::string& activity,
                                             const std::string& goal,
                                             domain::services::EvaluationMode mode = domain::services::EvaluationMode::Parallel);

    domain::BurnoutForecast ForecastBurnout(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Reshapes upcoming tasks and records the adaptations in the repository
     * (and the audit log when present).
     */
    domain::services::PlanAdjustment AdjustPlan(const domain::TradeOffDecision& current,
                                                const std::vector<domain::PlannedTask>& upcoming,
                                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    domain::WeeklyAdjustmentReport WeeklyReport(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /** @brief Weekly report rendered through the narrative strategy. */
    std::string WeeklyInsight(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    domain::DecisionStatistics Statistics();

    /** @brief Action distribution, per-category breakdown and the five most frequent constraints. */
    static domain::DecisionStatistics ComputeStatistics(const std::vector<domain::TradeOffDecision>& history);

    std::string NarrativeName() const;

    domain::HistoryRepository& Repository() { return *m_repository; }

private:
    std::shared_ptr<domain::HistoryRepository> m_repository;
    std::shared_ptr<domain::NarrativeService> m_narrative;
    std::shared_ptr<infrastructure::DecisionLogStore> m_logStore;
    domain::services::HealthCouncil m_council;
    domain::services::PlanAdjuster m_adjuster;
    std::mutex m_cycleMutex;
};

} // namespace equilibra::application
