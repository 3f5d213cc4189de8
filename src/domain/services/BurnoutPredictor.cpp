/**
 * @file BurnoutPredictor.cpp
 * @brief Implementation of BurnoutPredictor.
 */

#include "domain/services/BurnoutPredictor.hpp"
#include <algorithm>

namespace equilibra::domain::services {

namespace {

bool isRecoveryType(HealthCategory category) {
    return category == HealthCategory::Recovery || category == HealthCategory::Mindfulness;
}

std::vector<TradeOffDecision> trailingWindow(const std::vector<TradeOffDecision>& history,
                                             std::chrono::system_clock::time_point now) {
    const auto cutoff = now - std::chrono::hours(24 * BurnoutPredictor::kWindowDays);
    std::vector<TradeOffDecision> window;
    for (const auto& d : history) {
        if (d.timestamp >= cutoff && d.timestamp <= now) {
            window.push_back(d);
        }
    }
    return window;
}

} // namespace

BurnoutForecast BurnoutPredictor::LowRiskForecast() {
    BurnoutForecast f;
    f.riskScore = 10;
    f.primaryFactors = {"Insufficient data for analysis"};
    f.severity = RiskSeverity::Low;
    return f;
}

BurnoutForecast BurnoutPredictor::predict(const std::vector<TradeOffDecision>& history,
                                          std::chrono::system_clock::time_point now) {
    const auto window = trailingWindow(history, now);
    if (window.size() < 2) {
        return LowRiskForecast();
    }

    const RiskBreakdown r = breakdown(window);
    const int score = static_cast<int>(r.sleep * 0.35 + r.stress * 0.30 + r.recovery * 0.20 + r.energy * 0.15);

    BurnoutForecast f;
    f.riskScore = std::clamp(score, 0, 100);
    if (r.sleep > kFactorThreshold) f.primaryFactors.push_back("Sleep debt accumulation");
    if (r.stress > kFactorThreshold) f.primaryFactors.push_back("Chronic stress pattern");
    if (r.recovery > kFactorThreshold) f.primaryFactors.push_back("Insufficient recovery");
    if (r.energy > kFactorThreshold) f.primaryFactors.push_back("Rapid energy decline");
    if (f.primaryFactors.empty()) f.primaryFactors.push_back("No significant risk factors");

    f.daysToCrisis = DaysToCrisis(f.riskScore);
    f.interventionNeeded = f.riskScore >= kCriticalThreshold;
    f.severity = SeverityFor(f.riskScore);
    return f;
}

RiskBreakdown BurnoutPredictor::breakdown(const std::vector<TradeOffDecision>& window) {
    return {sleepRisk(window), stressRisk(window), recoveryRisk(window), energyDeclineRisk(window)};
}

int BurnoutPredictor::sleepRisk(const std::vector<TradeOffDecision>& window) {
    if (window.empty()) return 0;

    double total = 0.0;
    int run = 0;
    int longestRun = 0;
    for (const auto& d : window) {
        total += d.state.sleepHours;
        run = d.state.sleepHours < 6.0 ? run + 1 : 0;
        longestRun = std::max(longestRun, run);
    }
    const double mean = total / static_cast<double>(window.size());

    int risk = 0;
    if (mean < 6.5) risk += 40;
    else if (mean < 7.0) risk += 20;

    if (longestRun >= 3) risk += 50;
    else if (longestRun >= 2) risk += 30;

    return std::min(100, risk);
}

int BurnoutPredictor::stressRisk(const std::vector<TradeOffDecision>& window) {
    if (window.empty()) return 0;

    double total = 0.0;
    int run = 0;
    int longestRun = 0;
    for (const auto& d : window) {
        total += StressCode(d.state.stressLevel);
        run = d.state.stressLevel == StressLevel::High ? run + 1 : 0;
        longestRun = std::max(longestRun, run);
    }
    const double mean = total / static_cast<double>(window.size());

    int risk = 0;
    if (mean >= 2.5) risk += 40;

    if (longestRun >= 3) risk += 60;
    else if (longestRun >= 2) risk += 30;

    return std::min(100, risk);
}

int BurnoutPredictor::recoveryRisk(const std::vector<TradeOffDecision>& window) {
    int opportunities = 0;
    int skipped = 0;
    for (const auto& d : window) {
        for (const auto& dd : d.decisions) {
            if (!isRecoveryType(dd.category)) continue;
            ++opportunities;
            if (dd.action == DecisionAction::Skip) ++skipped;
        }
    }
    if (opportunities == 0) return 0;

    const double rate = static_cast<double>(skipped) / opportunities;
    if (rate >= 0.6) return 80;
    if (rate >= 0.4) return 50;
    if (rate >= 0.2) return 25;
    return 0;
}

int BurnoutPredictor::energyDeclineRisk(const std::vector<TradeOffDecision>& window) {
    if (window.size() < 3) return 0;

    double totalChange = 0.0;
    for (size_t i = 1; i < window.size(); ++i) {
        totalChange += window[i].state.energyLevel - window[i - 1].state.energyLevel;
    }
    const double mean = totalChange / static_cast<double>(window.size() - 1);

    if (mean <= -2.0) return 70;
    if (mean <= -1.0) return 40;
    if (mean < 0.0) return 20;
    return 0;
}

RiskSeverity BurnoutPredictor::SeverityFor(int score) {
    if (score >= kCriticalThreshold) return RiskSeverity::Critical;
    if (score >= kHighThreshold) return RiskSeverity::High;
    if (score >= kModerateThreshold) return RiskSeverity::Moderate;
    return RiskSeverity::Low;
}

std::optional<int> BurnoutPredictor::DaysToCrisis(int score) {
    if (score < kModerateThreshold) return std::nullopt;
    if (score >= 90) return 1;
    if (score >= 80) return 2;
    if (score >= 70) return 3;
    if (score >= 60) return 5;
    return 7;
}

} // namespace equilibra::domain::services
