/**
 * @file PlannedTask.hpp
 * @brief A unit of intended activity within one category.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Category.hpp"

namespace equilibra::domain {

/**
 * @struct PlannedTask
 * @brief What the user meant to do today in one category.
 */
struct PlannedTask {
    HealthCategory category = HealthCategory::Fitness;
    std::string name;
    int durationMinutes = 30;   ///< Strictly positive.
    double intensity = 0.5;     ///< Within [0, 1].
    std::string description;
};

/** @brief The default four-task day used by the dashboard and the simulator. */
inline std::vector<PlannedTask> SamplePlannedTasks() {
    return {
        {HealthCategory::Fitness, "HIIT Workout", 45, 0.8, "High-intensity interval training"},
        {HealthCategory::Nutrition, "Meal Prep", 60, 0.3, "Prepare healthy meals for the week"},
        {HealthCategory::Recovery, "Sleep Optimization", 30, 0.1, "Wind-down routine before bed"},
        {HealthCategory::Mindfulness, "Meditation Session", 20, 0.2, "Guided mindfulness meditation"}
    };
}

} // namespace equilibra::domain
