/**
 * @file WeekSimulationService.hpp
 * @brief Scenario-driven multi-day run of the full decision cycle.
 */

#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/NarrativeService.hpp"
#include "domain/UserProfile.hpp"
#include "domain/services/PlanAdjuster.hpp"

namespace equilibra::application {

/**
 * @struct SimulationScenario
 * @brief A named week expressed as fatigue and stress curves in [0,1].
 */
struct SimulationScenario {
    std::string key;
    std::string name;
    std::string description;
    std::array<double, 7> fatigue{};
    std::array<double, 7> stress{};
};

struct SimulatedDay {
    int day = 1;                                       ///< 1-based.
    domain::StateSnapshot state;
    domain::TradeOffDecision decision;
    std::vector<domain::AdaptationRecord> adaptations;
    std::optional<domain::DecisionNarrative> narrative;
    int readiness = 0;                                 ///< 0-100.
};

struct SimulationRun {
    SimulationScenario scenario;
    std::vector<SimulatedDay> days;
    domain::BurnoutForecast forecast;                  ///< Evaluated at the last simulated day.
    domain::WeeklyAdjustmentReport report;
};

/**
 * @class WeekSimulationService
 * @brief Builds one deterministic snapshot per day and feeds it through a
 * DecisionCycleService backed by a private in-memory history.
 *
 * Snapshot rules: sleep = 8 - 4 fatigue; energy = round(9 - 7 fatigue);
 * stress HIGH from 0.65, MEDIUM from 0.35. Sleep debt grows by the shortfall
 * under 7.5h and shrinks by 1h after a full night. The high-effort streak
 * grows when fitness ran at intensity 0.7 or more and resets otherwise.
 */
class WeekSimulationService {
public:
    using DayCallback = std::function<void(const SimulatedDay&)>;

    static constexpr double kFullNightHours = 7.5;
    static constexpr double kDebtRecoveryPerNight = 1.0;
    static constexpr double kHighEffortIntensity = 0.7;

    /** @param preferences Blended into priorities exactly as the interactive cycle does. */
    explicit WeekSimulationService(std::shared_ptr<domain::NarrativeService> narrative = nullptr,
                                   domain::ConstraintThresholds thresholds = {},
                                   domain::CategoryWeights preferences = domain::UniformCategoryWeights());

    static const std::vector<SimulationScenario>& Scenarios();

    /** @brief nullopt for an unknown key. */
    static std::optional<SimulationScenario> FindScenario(const std::string& key);

    /**
     * @brief Runs the scenario. An unknown key falls back to burnout_recovery.
     * @param onDay Invoked after each simulated day, on the calling thread.
     */
    SimulationRun Run(const std::string& scenarioKey,
                      int days = 7,
                      double timeAvailableHours = 2.0,
                      std::chrono::system_clock::time_point start = std::chrono::system_clock::now(),
                      const DayCallback& onDay = nullptr) const;

    /** @brief Snapshot for one day of the curve, before debt and streak carry-over. */
    static domain::StateSnapshot SnapshotFor(double fatigue, double stress, double timeAvailableHours);

    /** @brief True when the day's fitness decision counts toward the high-effort streak. */
    static bool IsHighEffortDay(const domain::TradeOffDecision& decision);

private:
    std::shared_ptr<domain::NarrativeService> m_narrative;
    domain::ConstraintThresholds m_thresholds;
    domain::CategoryWeights m_preferences;
};

} // namespace equilibra::application
