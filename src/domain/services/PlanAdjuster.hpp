/**
 * @file PlanAdjuster.hpp
 * @brief Reshapes upcoming tasks from today's decision and historical patterns.
 */

#pragma once

#include <chrono>
#include <vector>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"
#include "domain/PlannedTask.hpp"
#include "domain/services/PatternDetector.hpp"

namespace equilibra::domain::services {

struct PlanAdjustment {
    std::vector<PlannedTask> tasks;
    std::vector<AdaptationRecord> adaptations;
};

/**
 * @class PlanAdjuster
 * @brief Two passes over the upcoming tasks.
 *
 * The immediate pass reacts to the current decision's future impacts and
 * a skipped workout. The pattern pass, which needs enough history, softens
 * chronically skipped categories and flags recurring constraints.
 */
class PlanAdjuster {
public:
    static constexpr double kSkipPatternThreshold = 0.5;
    static constexpr double kFlexibleScale = 0.7;
    static constexpr int kChronicStressDays = 4;
    static constexpr int kChronicLowSleepDays = 5;

    explicit PlanAdjuster(int windowDays = 7) : m_windowDays(windowDays) {}

    PlanAdjustment adjustFuturePlan(const TradeOffDecision& current,
                                    const std::vector<PlannedTask>& upcoming,
                                    const std::vector<TradeOffDecision>& history,
                                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /**
     * @brief Adherence summary for the trailing window.
     * @param adaptationsMade Count of adaptation records logged so far.
     */
    WeeklyAdjustmentReport weeklyReport(const std::vector<TradeOffDecision>& history,
                                        int adaptationsMade = 0,
                                        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    void applyImmediate(const TradeOffDecision& current, PlanAdjustment& out,
                        std::chrono::system_clock::time_point now) const;
    void applyPatterns(const PatternDetector& detector, PlanAdjustment& out,
                       std::chrono::system_clock::time_point now) const;

    int m_windowDays;
};

} // namespace equilibra::domain::services
