/**
 * @file HealthState.hpp
 * @brief Immutable personal-state snapshot consumed by one decision cycle.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace equilibra::domain {

/**
 * @enum StressLevel
 * @brief Reported or derived stress band.
 */
enum class StressLevel {
    Low,
    Medium,
    High
};

inline std::string StressToString(StressLevel level) {
    switch (level) {
        case StressLevel::Low: return "LOW";
        case StressLevel::Medium: return "MEDIUM";
        case StressLevel::High: return "HIGH";
    }
    return "LOW";
}

/**
 * @brief Parses a stress level; accepts any casing and "MODERATE" as an alias of MEDIUM.
 * @throws std::invalid_argument for unknown values.
 */
inline StressLevel StressFromString(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LOW") return StressLevel::Low;
    if (upper == "MEDIUM" || upper == "MODERATE") return StressLevel::Medium;
    if (upper == "HIGH") return StressLevel::High;
    throw std::invalid_argument("Unknown stress level: " + value);
}

/** @brief Numeric stress code used by trend scoring (LOW=1, MEDIUM=2, HIGH=3). */
inline int StressCode(StressLevel level) {
    switch (level) {
        case StressLevel::Low: return 1;
        case StressLevel::Medium: return 2;
        case StressLevel::High: return 3;
    }
    return 1;
}

/**
 * @struct StateSnapshot
 * @brief The inputs for a single decision cycle.
 *
 * Produced by an external analyzer. Optional wearable extras default to
 * neutral values when absent.
 */
struct StateSnapshot {
    std::chrono::system_clock::time_point timestamp{}; ///< When the snapshot was taken.
    double sleepHours = 7.0;               ///< Last night's sleep, >= 0.
    int energyLevel = 5;                   ///< Self-reported energy, 1-10.
    StressLevel stressLevel = StressLevel::Medium;
    double timeAvailableHours = 2.0;       ///< Free time today, >= 0.
    double sleepDebtHours = 0.0;           ///< Accumulated deficit, >= 0.
    int consecutiveHighEffortDays = 0;     ///< Streak of demanding days, >= 0.

    std::optional<double> sleepQuality;    ///< 0-100 score from a wearable.
    std::optional<double> hrvMs;           ///< Heart rate variability.
    std::optional<int> restingHeartRate;   ///< Beats per minute.

    /** @brief Returns a copy with every field forced into its documented range and the timestamp cut to milliseconds. */
    StateSnapshot clamped() const {
        StateSnapshot s = *this;
        s.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(s.timestamp);
        s.sleepHours = std::max(0.0, s.sleepHours);
        s.energyLevel = std::clamp(s.energyLevel, 1, 10);
        s.timeAvailableHours = std::max(0.0, s.timeAvailableHours);
        s.sleepDebtHours = std::max(0.0, s.sleepDebtHours);
        s.consecutiveHighEffortDays = std::max(0, s.consecutiveHighEffortDays);
        if (s.sleepQuality) s.sleepQuality = std::clamp(*s.sleepQuality, 0.0, 100.0);
        return s;
    }

    /**
     * @brief Readiness score 0-100.
     *
     * HRV 40% (20-100ms range), sleep quality 30%, inverted resting HR 20%
     * (40-100bpm range), sleep balance 10% (10h of debt scores zero).
     */
    int readinessScore() const {
        const double hrv = hrvMs.value_or(40.0);
        const double hrvScore = std::clamp((hrv - 20.0) / 80.0, 0.0, 1.0) * 100.0;

        const double rhr = static_cast<double>(restingHeartRate.value_or(70));
        const double rhrScore = 100.0 - std::clamp((rhr - 40.0) / 60.0, 0.0, 1.0) * 100.0;

        const double debtScore = std::max(0.0, 100.0 - sleepDebtHours * 10.0);
        const double quality = sleepQuality.value_or(75.0);

        const double score = hrvScore * 0.40 + quality * 0.30 + rhrScore * 0.20 + debtScore * 0.10;
        return static_cast<int>(std::lround(score));
    }
};

} // namespace equilibra::domain
