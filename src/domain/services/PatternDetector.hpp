/**
 * @file PatternDetector.hpp
 * @brief Mines skip/downgrade frequency and constraint recurrence from history.
 */

#pragma once

#include <array>
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"

namespace equilibra::domain::services {

/**
 * @class PatternDetector
 * @brief Read-only view over the decisions inside a trailing window.
 *
 * Frequencies are (matching decisions) / (decisions in window). With fewer
 * than kMinimumDecisions entries the status is InsufficientData.
 */
class PatternDetector {
public:
    static constexpr int kMinimumDecisions = 3;

    PatternDetector(const std::vector<TradeOffDecision>& history,
                    int windowDays = 7,
                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    PatternStatus status() const;
    size_t decisionsInWindow() const { return m_window.size(); }
    int windowDays() const { return m_windowDays; }

    double skipFrequency(HealthCategory category) const;
    double downgradeFrequency(HealthCategory category) const;

    /** @brief Occurrences of each constraint name across the window. */
    std::map<std::string, int> constraintCounts() const;
    int constraintCount(ConstraintKind kind) const;

    /** @brief Per-weekday counts over the whole history, index 0 = Monday (UTC). */
    std::array<WeekdayStats, 7> weekdayBreakdown() const;

    static int WeekdayIndex(std::chrono::system_clock::time_point when);

private:
    double actionFrequency(HealthCategory category, DecisionAction action) const;

    std::vector<TradeOffDecision> m_history;
    std::vector<TradeOffDecision> m_window;
    int m_windowDays;
};

} // namespace equilibra::domain::services
