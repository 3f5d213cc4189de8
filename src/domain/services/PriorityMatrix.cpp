/**
 * @file PriorityMatrix.cpp
 * @brief Implementation of PriorityMatrix.
 */

#include "domain/services/PriorityMatrix.hpp"
#include <algorithm>
#include <map>

namespace equilibra::domain::services {

CategoryWeights PriorityMatrix::BasePriorities() {
    return {
        {HealthCategory::Recovery, 0.30},
        {HealthCategory::Nutrition, 0.25},
        {HealthCategory::Fitness, 0.25},
        {HealthCategory::Mindfulness, 0.20}
    };
}

std::vector<std::pair<HealthCategory, double>> PriorityMatrix::ModifiersFor(ConstraintKind kind) {
    using C = HealthCategory;
    switch (kind) {
        case ConstraintKind::CriticalSleep:
            return {{C::Recovery, +0.25}, {C::Fitness, -0.20}, {C::Mindfulness, +0.05}};
        case ConstraintKind::LowSleep:
            return {{C::Recovery, +0.15}, {C::Fitness, -0.10}};
        case ConstraintKind::HighStress:
            return {{C::Mindfulness, +0.20}, {C::Fitness, -0.10}, {C::Recovery, +0.10}};
        case ConstraintKind::LowEnergy:
            return {{C::Recovery, +0.10}, {C::Fitness, -0.15}};
        case ConstraintKind::CriticalEnergy:
            return {{C::Recovery, +0.20}, {C::Fitness, -0.25}, {C::Mindfulness, +0.10}};
        case ConstraintKind::OvertrainingRisk:
            return {{C::Recovery, +0.20}, {C::Fitness, -0.20}};
        case ConstraintKind::BurnoutWarning:
            return {{C::Recovery, +0.25}, {C::Fitness, -0.25}, {C::Mindfulness, +0.15}, {C::Nutrition, -0.10}};
        case ConstraintKind::TimeLimited:
            return {{C::Fitness, +0.05}};
        case ConstraintKind::TimeCritical:
            return {{C::Nutrition, +0.10}, {C::Fitness, -0.15}};
        case ConstraintKind::SleepDebtAccumulated:
            return {};
    }
    return {};
}

PriorityResult PriorityMatrix::compute(const ActiveConstraints& constraints,
                                       const std::optional<CategoryWeights>& preferences) {
    PriorityResult result;
    CategoryWeights priorities = BasePriorities();

    for (const auto& constraint : constraints.items()) {
        for (const auto& [category, modifier] : ModifiersFor(constraint.kind)) {
            const double scaled = modifier * constraint.severity;
            priorities[category] += scaled;
            result.adjustments.push_back({category, ConstraintKindToString(constraint.kind), scaled});
        }
    }

    if (preferences) {
        for (auto category : kAllCategories) {
            auto it = preferences->find(category);
            if (it == preferences->end()) continue;
            const double before = priorities[category];
            const double blended = before * (1.0 - kPreferenceWeight) + it->second * kPreferenceWeight;
            priorities[category] = blended;
            if (blended != before) {
                result.adjustments.push_back({category, "user_preference", blended - before});
            }
        }
    }

    result.priorities = normalizeWithFloor(priorities);
    return result;
}

CategoryWeights PriorityMatrix::normalizeWithFloor(const CategoryWeights& raw) {
    // Categories pinned to the floor leave the remaining share to the others.
    // Repeat until no free category falls below the floor after scaling.
    std::map<HealthCategory, bool> pinned;
    for (const auto& [category, value] : raw) {
        pinned[category] = value <= kFloor;
    }

    CategoryWeights out;
    bool changed = true;
    while (changed) {
        changed = false;
        double freeTotal = 0.0;
        int pinnedCount = 0;
        for (const auto& [category, value] : raw) {
            if (pinned[category]) {
                ++pinnedCount;
            } else {
                freeTotal += value;
            }
        }

        const int freeCount = static_cast<int>(raw.size()) - pinnedCount;
        if (freeCount == 0) {
            // Nothing above the floor: fall back to a uniform split.
            for (const auto& entry : raw) {
                out[entry.first] = 1.0 / static_cast<double>(raw.size());
            }
            break;
        }

        const double share = 1.0 - kFloor * static_cast<double>(pinnedCount);
        for (const auto& [category, value] : raw) {
            if (pinned[category]) {
                out[category] = kFloor;
            } else if (freeTotal > 0.0) {
                out[category] = value / freeTotal * share;
                if (out[category] < kFloor) {
                    pinned[category] = true;
                    changed = true;
                }
            } else {
                out[category] = share / static_cast<double>(freeCount);
            }
        }
    }
    return out;
}

} // namespace equilibra::domain::services
