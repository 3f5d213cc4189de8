/**
 * @file ConstraintEvaluator.hpp
 * @brief Domain service that maps a state snapshot to active constraints.
 */

#pragma once

#include "domain/Constraint.hpp"
#include "domain/HealthState.hpp"
#include "domain/UserProfile.hpp"

namespace equilibra::domain::services {

/**
 * @class ConstraintEvaluator
 * @brief Applies the independent sleep, energy, stress, time and effort rules,
 * then derives the compound burnout constraint.
 *
 * Deterministic and side-effect free.
 */
class ConstraintEvaluator {
public:
    static ActiveConstraints evaluate(const StateSnapshot& state,
                                      const ConstraintThresholds& thresholds = {});

    /**
     * @brief Number of burnout-indicator groups present.
     *
     * Groups: low or critical sleep, low or critical energy, high_stress,
     * overtraining_risk. Sleep debt does not count.
     */
    static int countBurnoutIndicators(const ActiveConstraints& constraints);
};

} // namespace equilibra::domain::services
