/**
 * @file PriorityMatrix.hpp
 * @brief Dynamic per-category weighting driven by active constraints.
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "domain/Category.hpp"
#include "domain/Constraint.hpp"
#include "domain/Decision.hpp"

namespace equilibra::domain::services {

/** @brief Final distribution plus the trace of every contribution. */
struct PriorityResult {
    CategoryWeights priorities;
    std::vector<PriorityAdjustment> adjustments;
};

class PriorityMatrix {
public:
    static constexpr double kPreferenceWeight = 0.30;
    static constexpr double kFloor = 0.05;

    /** @brief Base distribution: recovery 0.30, nutrition 0.25, fitness 0.25, mindfulness 0.20. */
    static CategoryWeights BasePriorities();

    /** @brief Unscaled modifier table entry for a constraint. Empty when none is registered. */
    static std::vector<std::pair<HealthCategory, double>> ModifiersFor(ConstraintKind kind);

    /**
     * @brief Applies severity-scaled modifiers, the optional preference blend,
     * the floor, then renormalizes so the four values sum to 1.
     */
    static PriorityResult compute(const ActiveConstraints& constraints,
                                  const std::optional<CategoryWeights>& preferences = std::nullopt);

    /** @brief Renormalizes to a sum of 1 with every category at or above kFloor. */
    static CategoryWeights normalizeWithFloor(const CategoryWeights& raw);
};

} // namespace equilibra::domain::services
