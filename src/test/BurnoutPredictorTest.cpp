#undef NDEBUG
#include <cassert>
#include <chrono>
#include <iostream>
#include "domain/services/BurnoutPredictor.hpp"

using namespace equilibra::domain;
using equilibra::domain::services::BurnoutPredictor;

namespace {

using Clock = std::chrono::system_clock;

TradeOffDecision entry(Clock::time_point when, double sleep, StressLevel stress, int energy,
                       DecisionAction recoveryAction) {
    TradeOffDecision d;
    d.timestamp = when;
    d.state.sleepHours = sleep;
    d.state.stressLevel = stress;
    d.state.energyLevel = energy;
    DomainDecision recovery;
    recovery.category = HealthCategory::Recovery;
    recovery.action = recoveryAction;
    DomainDecision mindfulness;
    mindfulness.category = HealthCategory::Mindfulness;
    mindfulness.action = recoveryAction;
    d.decisions = {recovery, mindfulness};
    return d;
}

} // namespace

int main() {
    std::cout << "[Test] Starting BurnoutPredictor Test..." << std::endl;
    const auto now = Clock::now();
    const auto day = std::chrono::hours(24);

    // Empty or single entry history.
    {
        auto f = BurnoutPredictor::predict({}, now);
        assert(f.riskScore == 10);
        assert(f.severity == RiskSeverity::Low);
        assert(!f.primaryFactors.empty());

        f = BurnoutPredictor::predict({entry(now, 4.0, StressLevel::High, 1, DecisionAction::Skip)}, now);
        assert(f.riskScore == 10);
        assert(f.severity == RiskSeverity::Low);
    }

    // Entries outside the trailing seven days do not count.
    {
        std::vector<TradeOffDecision> history = {
            entry(now - day * 20, 4.0, StressLevel::High, 2, DecisionAction::Skip),
            entry(now - day * 10, 4.0, StressLevel::High, 2, DecisionAction::Skip),
            entry(now, 4.0, StressLevel::High, 2, DecisionAction::Skip)};
        assert(BurnoutPredictor::predict(history, now).riskScore == 10);
    }

    std::cout << "[Test] A week of short sleep and high stress..." << std::endl;
    {
        std::vector<TradeOffDecision> history;
        for (int i = 0; i < 7; ++i) {
            history.push_back(entry(now - day * (6 - i), 5.0, StressLevel::High, 8 - i, DecisionAction::Skip));
        }
        auto r = BurnoutPredictor::breakdown(history);
        assert(r.sleep == 90);
        assert(r.stress == 100);
        assert(r.recovery == 80);
        assert(r.energy == 40);

        auto f = BurnoutPredictor::predict(history, now);
        assert(f.riskScore == 83);
        assert(f.severity == RiskSeverity::Critical);
        assert(f.interventionNeeded);
        assert(f.daysToCrisis && *f.daysToCrisis == 2);
        assert(f.primaryFactors.size() == 3);
        assert(f.primaryFactors[0] == "Sleep debt accumulation");
    }

    std::cout << "[Test] A balanced week..." << std::endl;
    {
        std::vector<TradeOffDecision> history;
        for (int i = 0; i < 5; ++i) {
            history.push_back(entry(now - day * i, 8.0, StressLevel::Low, 7, DecisionAction::Maintain));
        }
        auto f = BurnoutPredictor::predict(history, now);
        assert(f.riskScore == 0);
        assert(f.severity == RiskSeverity::Low);
        assert(!f.interventionNeeded);
        assert(!f.daysToCrisis);
        assert(f.primaryFactors.size() == 1 && f.primaryFactors[0] == "No significant risk factors");
    }

    // Sub-score tiers.
    {
        std::vector<TradeOffDecision> w = {
            entry(now, 6.8, StressLevel::Medium, 5, DecisionAction::Maintain),
            entry(now, 6.8, StressLevel::Medium, 5, DecisionAction::Maintain)};
        assert(BurnoutPredictor::sleepRisk(w) == 20);
        assert(BurnoutPredictor::stressRisk(w) == 0);
        assert(BurnoutPredictor::energyDeclineRisk(w) == 0);
    }

    assert(BurnoutPredictor::SeverityFor(29) == RiskSeverity::Low);
    assert(BurnoutPredictor::SeverityFor(30) == RiskSeverity::Moderate);
    assert(BurnoutPredictor::SeverityFor(50) == RiskSeverity::High);
    assert(BurnoutPredictor::SeverityFor(70) == RiskSeverity::Critical);
    assert(!BurnoutPredictor::DaysToCrisis(10));
    assert(*BurnoutPredictor::DaysToCrisis(95) == 1);
    assert(*BurnoutPredictor::DaysToCrisis(65) == 5);
    assert(*BurnoutPredictor::DaysToCrisis(35) == 7);

    std::cout << "[PASS] BurnoutPredictor Test Passed" << std::endl;
    return 0;
}
