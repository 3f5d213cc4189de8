#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include "domain/services/ConstraintEvaluator.hpp"

using namespace equilibra::domain;
using equilibra::domain::services::ConstraintEvaluator;

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

StateSnapshot rested() {
    StateSnapshot s;
    s.sleepHours = 8.0;
    s.energyLevel = 8;
    s.stressLevel = StressLevel::Low;
    s.timeAvailableHours = 3.0;
    return s;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConstraintEvaluator Test..." << std::endl;

    // A rested, unhurried state produces nothing.
    {
        auto c = ConstraintEvaluator::evaluate(rested());
        assert(c.empty());
    }

    // Sleep bands are exclusive.
    {
        auto s = rested();
        s.sleepHours = 4.0;
        auto c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::CriticalSleep));
        assert(!c.has(ConstraintKind::LowSleep));
        assert(near(c.severityOf(ConstraintKind::CriticalSleep), 0.9));

        s.sleepHours = 5.4;
        c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::LowSleep));
        assert(!c.has(ConstraintKind::CriticalSleep));
        assert(near(c.severityOf(ConstraintKind::LowSleep), 1.0 - 5.4 / 6.0));
    }

    // Graded severity never exceeds 0.7.
    {
        auto s = rested();
        s.timeAvailableHours = 0.5;
        auto c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::TimeLimited));
        assert(near(c.severityOf(ConstraintKind::TimeLimited), 1.0 - 0.5 / 1.5));

        s.timeAvailableHours = 0.2;
        c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::TimeCritical));
        assert(!c.has(ConstraintKind::TimeLimited));
    }

    // Sleep debt tiers.
    {
        auto s = rested();
        s.sleepDebtHours = 3.0;
        assert(near(ConstraintEvaluator::evaluate(s).severityOf(ConstraintKind::SleepDebtAccumulated), 0.5));
        s.sleepDebtHours = 6.5;
        assert(near(ConstraintEvaluator::evaluate(s).severityOf(ConstraintKind::SleepDebtAccumulated), 0.8));
        s.sleepDebtHours = 2.9;
        assert(!ConstraintEvaluator::evaluate(s).has(ConstraintKind::SleepDebtAccumulated));
    }

    // Energy: critical at or below 2, low at or below 4 with the widened grading threshold.
    {
        auto s = rested();
        s.energyLevel = 2;
        auto c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::CriticalEnergy));
        assert(!c.has(ConstraintKind::LowEnergy));

        s.energyLevel = 4;
        c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::LowEnergy));
        assert(near(c.severityOf(ConstraintKind::LowEnergy), 1.0 - 4.0 / 6.0));
    }

    // Out of range input is clamped before the rules run.
    {
        auto s = rested();
        s.energyLevel = -5;
        s.sleepHours = -1.0;
        auto c = ConstraintEvaluator::evaluate(s);
        assert(c.has(ConstraintKind::CriticalEnergy));
        assert(c.has(ConstraintKind::CriticalSleep));
        for (const auto& item : c.items()) {
            assert(item.severity >= 0.0 && item.severity <= 1.0);
        }
    }

    // Custom thresholds move the boundaries.
    {
        ConstraintThresholds t;
        t.minSleepHours = 9.0;
        t.criticalSleepHours = 7.0;
        auto s = rested();
        auto c = ConstraintEvaluator::evaluate(s, t);
        assert(c.has(ConstraintKind::LowSleep));
    }

    // Burnout warning appears exactly when three or more indicator groups are active.
    std::cout << "[Test] Checking burnout warning over every indicator combination..." << std::endl;
    int combinations = 0;
    for (int mask = 0; mask < 16; ++mask) {
        for (int variant = 0; variant < 2; ++variant) {
            auto s = rested();
            int expected = 0;
            if (mask & 1) { s.sleepHours = variant ? 4.0 : 5.5; ++expected; }
            if (mask & 2) { s.energyLevel = variant ? 1 : 3; ++expected; }
            if (mask & 4) { s.stressLevel = StressLevel::High; ++expected; }
            if (mask & 8) { s.consecutiveHighEffortDays = 3 + variant; ++expected; }

            auto c = ConstraintEvaluator::evaluate(s);
            assert(ConstraintEvaluator::countBurnoutIndicators(c) == expected);
            assert(c.has(ConstraintKind::BurnoutWarning) == (expected >= 3));
            if (expected >= 3) {
                assert(near(c.severityOf(ConstraintKind::BurnoutWarning), 0.85));
            }
            ++combinations;
        }
    }
    assert(combinations == 32);

    std::cout << "[PASS] ConstraintEvaluator Test Passed" << std::endl;
    return 0;
}
