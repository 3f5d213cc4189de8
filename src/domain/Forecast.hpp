/**
 * @file Forecast.hpp
 * @brief Burnout forecasts, pattern reports and plan adaptation records.
 */

#pragma once

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "domain/Category.hpp"

namespace equilibra::domain {

/**
 * @enum RiskSeverity
 * @brief Burnout severity tier derived from the composite score.
 */
enum class RiskSeverity {
    Low,
    Moderate,
    High,
    Critical
};

inline std::string SeverityToString(RiskSeverity severity) {
    switch (severity) {
        case RiskSeverity::Low: return "low";
        case RiskSeverity::Moderate: return "moderate";
        case RiskSeverity::High: return "high";
        case RiskSeverity::Critical: return "critical";
    }
    return "low";
}

inline RiskSeverity SeverityFromString(const std::string& value) {
    if (value == "low") return RiskSeverity::Low;
    if (value == "moderate") return RiskSeverity::Moderate;
    if (value == "high") return RiskSeverity::High;
    if (value == "critical") return RiskSeverity::Critical;
    throw std::invalid_argument("Unknown severity: " + value);
}

/**
 * @struct BurnoutForecast
 * @brief Sustained-risk estimate over the trailing week.
 */
struct BurnoutForecast {
    int riskScore = 10;                       ///< 0-100.
    std::optional<int> daysToCrisis;
    std::vector<std::string> primaryFactors;  ///< Never empty.
    bool interventionNeeded = false;
    RiskSeverity severity = RiskSeverity::Low;
};

/**
 * @struct AdaptationRecord
 * @brief Audit entry describing one change made to future plans.
 */
struct AdaptationRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string patternDetected;
    std::string adaptationMade;
    std::vector<HealthCategory> affectedCategories;
    std::string reasoning;
};

/** @brief Per-weekday aggregates, index 0 = Monday. */
struct WeekdayStats {
    int decisions = 0;
    int constraints = 0;
    int skips = 0;
    double avgConstraints = 0.0;
    double skipRate = 0.0;
};

/**
 * @enum PatternStatus
 * @brief Whether a pattern analysis had enough history to say anything.
 */
enum class PatternStatus {
    Ok,
    InsufficientData
};

inline std::string PatternStatusToString(PatternStatus status) {
    return status == PatternStatus::Ok ? "ok" : "insufficient_data";
}

struct CategoryRates {
    double skipRate = 0.0;        ///< Percent, one decimal.
    double downgradeRate = 0.0;   ///< Percent, one decimal.
};

/**
 * @struct WeeklyAdjustmentReport
 * @brief Summary of adherence patterns over the trailing window.
 */
struct WeeklyAdjustmentReport {
    PatternStatus status = PatternStatus::InsufficientData;
    int windowDays = 7;
    int totalDecisions = 0;
    std::map<HealthCategory, CategoryRates> categories;
    std::map<std::string, int> constraintFrequency;
    std::array<WeekdayStats, 7> weekdays{};
    int adaptationsMade = 0;
    std::vector<std::string> recommendations;
};

/**
 * @struct DecisionStatistics
 * @brief Aggregate counts over the whole stored history.
 */
struct DecisionStatistics {
    int totalDecisions = 0;
    std::map<std::string, int> actionDistribution;
    std::map<HealthCategory, std::map<std::string, int>> categoryBreakdown;
    std::vector<std::pair<std::string, int>> topConstraints;   ///< At most five, most frequent first.
};

} // namespace equilibra::domain
