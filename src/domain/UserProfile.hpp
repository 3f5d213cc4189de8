/**
 * @file UserProfile.hpp
 * @brief Per-user thresholds and category preferences.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Category.hpp"

namespace equilibra::domain {

/**
 * @struct ConstraintThresholds
 * @brief Tunable limits used by the constraint evaluator.
 */
struct ConstraintThresholds {
    double minSleepHours = 6.0;
    double criticalSleepHours = 5.0;
    int lowEnergy = 4;
    int criticalEnergy = 2;
    double minTimeHours = 0.5;
    double limitedTimeHours = 1.5;
    int maxConsecutiveHighEffortDays = 3;
    double sleepDebtWarningHours = 3.0;
    double sleepDebtCriticalHours = 6.0;
};

struct UserProfile {
    std::string userId = "default";
    std::string name;
    std::string primaryGoal;
    ConstraintThresholds thresholds;
    std::optional<CategoryWeights> preferences = UniformCategoryWeights(); ///< nullopt disables the preference blend.
};

} // namespace equilibra::domain
