/**
 * @file PatternDetector.cpp
 * @brief Implementation of PatternDetector.
 */

#include "domain/services/PatternDetector.hpp"
#include <algorithm>

namespace equilibra::domain::services {

PatternDetector::PatternDetector(const std::vector<TradeOffDecision>& history, int windowDays,
                                 std::chrono::system_clock::time_point now)
    : m_history(history), m_windowDays(std::max(1, windowDays)) {
    const auto cutoff = now - std::chrono::hours(24 * m_windowDays);
    for (const auto& d : m_history) {
        if (d.timestamp >= cutoff && d.timestamp <= now) {
            m_window.push_back(d);
        }
    }
}

PatternStatus PatternDetector::status() const {
    return m_window.size() >= static_cast<size_t>(kMinimumDecisions) ? PatternStatus::Ok
                                                                     : PatternStatus::InsufficientData;
}

double PatternDetector::actionFrequency(HealthCategory category, DecisionAction action) const {
    if (m_window.empty()) return 0.0;
    int matches = 0;
    for (const auto& d : m_window) {
        for (const auto& dd : d.decisions) {
            if (dd.category == category && dd.action == action) ++matches;
        }
    }
    return static_cast<double>(matches) / static_cast<double>(m_window.size());
}

double PatternDetector::skipFrequency(HealthCategory category) const {
    return actionFrequency(category, DecisionAction::Skip);
}

double PatternDetector::downgradeFrequency(HealthCategory category) const {
    return actionFrequency(category, DecisionAction::Downgrade);
}

std::map<std::string, int> PatternDetector::constraintCounts() const {
    std::map<std::string, int> counts;
    for (const auto& d : m_window) {
        for (auto kind : d.activeConstraints) {
            ++counts[ConstraintKindToString(kind)];
        }
    }
    return counts;
}

int PatternDetector::constraintCount(ConstraintKind kind) const {
    int count = 0;
    for (const auto& d : m_window) {
        if (d.hasConstraint(kind)) ++count;
    }
    return count;
}

int PatternDetector::WeekdayIndex(std::chrono::system_clock::time_point when) {
    const auto days = std::chrono::duration_cast<std::chrono::hours>(when.time_since_epoch()).count() / 24;
    // 1970-01-01 was a Thursday (index 3).
    const long long index = (days + 3) % 7;
    return static_cast<int>(index < 0 ? index + 7 : index);
}

std::array<WeekdayStats, 7> PatternDetector::weekdayBreakdown() const {
    std::array<WeekdayStats, 7> stats{};
    for (const auto& d : m_history) {
        auto& day = stats[WeekdayIndex(d.timestamp)];
        ++day.decisions;
        day.constraints += static_cast<int>(d.activeConstraints.size());
        for (const auto& dd : d.decisions) {
            if (dd.action == DecisionAction::Skip) ++day.skips;
        }
    }
    for (auto& day : stats) {
        if (day.decisions > 0) {
            day.avgConstraints = static_cast<double>(day.constraints) / day.decisions;
            day.skipRate = static_cast<double>(day.skips) / day.decisions;
        }
    }
    return stats;
}

} // namespace equilibra::domain::services
