/**
 * @file BurnoutPredictor.hpp
 * @brief Rolling-window burnout risk scorer.
 */

#pragma once

#include <chrono>
#include <optional>
#include <vector>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"

namespace equilibra::domain::services {

/** @brief The four 0-100 sub-scores behind a forecast. */
struct RiskBreakdown {
    int sleep = 0;
    int stress = 0;
    int recovery = 0;
    int energy = 0;
};

/**
 * @class BurnoutPredictor
 * @brief Scores sustained risk from the trailing seven days of decisions.
 *
 * Composite = 0.35 sleep + 0.30 stress + 0.20 recovery + 0.15 energy,
 * truncated to an integer.
 */
class BurnoutPredictor {
public:
    static constexpr int kWindowDays = 7;
    static constexpr int kCriticalThreshold = 70;
    static constexpr int kHighThreshold = 50;
    static constexpr int kModerateThreshold = 30;
    static constexpr int kFactorThreshold = 60;

    static BurnoutForecast predict(const std::vector<TradeOffDecision>& history,
                                   std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    static RiskBreakdown breakdown(const std::vector<TradeOffDecision>& window);

    static int sleepRisk(const std::vector<TradeOffDecision>& window);
    static int stressRisk(const std::vector<TradeOffDecision>& window);
    static int recoveryRisk(const std::vector<TradeOffDecision>& window);
    static int energyDeclineRisk(const std::vector<TradeOffDecision>& window);

    static RiskSeverity SeverityFor(int score);
    static std::optional<int> DaysToCrisis(int score);

    /** @brief Forecast returned when fewer than two decisions fall in the window. */
    static BurnoutForecast LowRiskForecast();
};

} // namespace equilibra::domain::services
