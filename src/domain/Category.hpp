/**
 * @file Category.hpp
 * @brief The closed set of life domains the engine arbitrates between.
 */

#pragma once

#include <array>
#include <map>
#include <stdexcept>
#include <string>

namespace equilibra::domain {

/**
 * @enum HealthCategory
 * @brief The four fixed categories.
 *
 * Declaration order is the base-priority order and doubles as the
 * tie-break order when two categories share an adjusted priority.
 */
enum class HealthCategory {
    Recovery,
    Nutrition,
    Fitness,
    Mindfulness
};

/** @brief Per-category weights, iterated in declaration order. */
using CategoryWeights = std::map<HealthCategory, double>;

/** @brief All categories in declaration order. */
inline constexpr std::array<HealthCategory, 4> kAllCategories = {
    HealthCategory::Recovery,
    HealthCategory::Nutrition,
    HealthCategory::Fitness,
    HealthCategory::Mindfulness
};

inline std::string CategoryToString(HealthCategory category) {
    switch (category) {
        case HealthCategory::Recovery: return "recovery";
        case HealthCategory::Nutrition: return "nutrition";
        case HealthCategory::Fitness: return "fitness";
        case HealthCategory::Mindfulness: return "mindfulness";
    }
    return "recovery";
}

/**
 * @brief Parses a lowercase category name.
 * @throws std::invalid_argument for names outside the closed set.
 */
inline HealthCategory CategoryFromString(const std::string& value) {
    if (value == "recovery") return HealthCategory::Recovery;
    if (value == "nutrition") return HealthCategory::Nutrition;
    if (value == "fitness") return HealthCategory::Fitness;
    if (value == "mindfulness") return HealthCategory::Mindfulness;
    throw std::invalid_argument("Unknown category: " + value);
}

/** @brief Uniform weights (0.25 each), the default user preference. */
inline CategoryWeights UniformCategoryWeights() {
    CategoryWeights weights;
    for (auto category : kAllCategories) {
        weights[category] = 0.25;
    }
    return weights;
}

} // namespace equilibra::domain
