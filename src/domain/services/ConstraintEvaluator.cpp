/**
 * @file ConstraintEvaluator.cpp
 * @brief Implementation of ConstraintEvaluator.
 */

#include "domain/services/ConstraintEvaluator.hpp"
#include <algorithm>

namespace equilibra::domain::services {

namespace {
constexpr double kCriticalSeverity = 0.9;
constexpr double kGradedCap = 0.7;
constexpr double kDebtCriticalSeverity = 0.8;
constexpr double kDebtWarningSeverity = 0.5;
constexpr double kHighStressSeverity = 0.7;
constexpr double kOvertrainingSeverity = 0.6;
constexpr double kBurnoutSeverity = 0.85;
constexpr int kBurnoutIndicatorThreshold = 3;

double graded(double value, double threshold) {
    if (threshold <= 0.0) return kGradedCap;
    return std::clamp(std::min(kGradedCap, 1.0 - value / threshold), 0.0, 1.0);
}
}

ActiveConstraints ConstraintEvaluator::evaluate(const StateSnapshot& input,
                                                const ConstraintThresholds& t) {
    const StateSnapshot state = input.clamped();
    ActiveConstraints result;

    // Sleep
    if (state.sleepHours < t.criticalSleepHours) {
        result.add(ConstraintKind::CriticalSleep, kCriticalSeverity, ConstraintSource::Wearable);
    } else if (state.sleepHours < t.minSleepHours) {
        result.add(ConstraintKind::LowSleep, graded(state.sleepHours, t.minSleepHours),
                   ConstraintSource::Wearable);
    }

    if (state.sleepDebtHours >= t.sleepDebtCriticalHours) {
        result.add(ConstraintKind::SleepDebtAccumulated, kDebtCriticalSeverity, ConstraintSource::Derived);
    } else if (state.sleepDebtHours >= t.sleepDebtWarningHours) {
        result.add(ConstraintKind::SleepDebtAccumulated, kDebtWarningSeverity, ConstraintSource::Derived);
    }

    // Energy
    if (state.energyLevel <= t.criticalEnergy) {
        result.add(ConstraintKind::CriticalEnergy, kCriticalSeverity, ConstraintSource::UserInput);
    } else if (state.energyLevel <= t.lowEnergy) {
        result.add(ConstraintKind::LowEnergy,
                   graded(static_cast<double>(state.energyLevel), static_cast<double>(t.lowEnergy + 2)),
                   ConstraintSource::UserInput);
    }

    if (state.stressLevel == StressLevel::High) {
        result.add(ConstraintKind::HighStress, kHighStressSeverity, ConstraintSource::UserInput);
    }

    // Time
    if (state.timeAvailableHours < t.minTimeHours) {
        result.add(ConstraintKind::TimeCritical, kCriticalSeverity, ConstraintSource::UserInput);
    } else if (state.timeAvailableHours < t.limitedTimeHours) {
        result.add(ConstraintKind::TimeLimited, graded(state.timeAvailableHours, t.limitedTimeHours),
                   ConstraintSource::UserInput);
    }

    if (state.consecutiveHighEffortDays >= t.maxConsecutiveHighEffortDays) {
        result.add(ConstraintKind::OvertrainingRisk, kOvertrainingSeverity, ConstraintSource::Derived);
    }

    // Compound, only after every base rule ran.
    if (countBurnoutIndicators(result) >= kBurnoutIndicatorThreshold) {
        result.add(ConstraintKind::BurnoutWarning, kBurnoutSeverity, ConstraintSource::Derived);
    }

    return result;
}

int ConstraintEvaluator::countBurnoutIndicators(const ActiveConstraints& c) {
    int count = 0;
    if (c.hasAny({ConstraintKind::LowSleep, ConstraintKind::CriticalSleep})) ++count;
    if (c.hasAny({ConstraintKind::LowEnergy, ConstraintKind::CriticalEnergy})) ++count;
    if (c.has(ConstraintKind::HighStress)) ++count;
    if (c.has(ConstraintKind::OvertrainingRisk)) ++count;
    return count;
}

} // namespace equilibra::domain::services
