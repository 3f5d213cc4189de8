/**
 * @file PlanAdjuster.cpp
 * @brief Implementation of PlanAdjuster.
 */

#include "domain/services/PlanAdjuster.hpp"
#include <algorithm>
#include <cmath>

namespace equilibra::domain::services {

namespace {

std::chrono::system_clock::time_point toMillis(std::chrono::system_clock::time_point t) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(t);
}

double roundedPercent(double fraction) {
    return std::round(fraction * 1000.0) / 10.0;
}

} // namespace

PlanAdjustment PlanAdjuster::adjustFuturePlan(const TradeOffDecision& current,
                                              const std::vector<PlannedTask>& upcoming,
                                              const std::vector<TradeOffDecision>& history,
                                              std::chrono::system_clock::time_point now) const {
    PlanAdjustment out;
    out.tasks = upcoming;

    applyImmediate(current, out, now);

    PatternDetector detector(history, m_windowDays, now);
    if (detector.status() == PatternStatus::Ok) {
        applyPatterns(detector, out, now);
    }
    return out;
}

void PlanAdjuster::applyImmediate(const TradeOffDecision& current, PlanAdjustment& out,
                                  std::chrono::system_clock::time_point now) const {
    double factor = 1.0;
    for (const auto& impact : current.futureImpacts) {
        if (impact.adjustmentType == "intensity_reduction") {
            factor = 0.6;
            break;
        }
        if (impact.adjustmentType == "deload_week") {
            factor = 0.5;
            break;
        }
    }

    if (factor < 1.0) {
        for (auto& task : out.tasks) {
            task.intensity = std::clamp(task.intensity * factor, 0.0, 1.0);
        }
        AdaptationRecord record;
        record.timestamp = toMillis(now);
        record.patternDetected = "high_fatigue_signals";
        record.adaptationMade = "Reduced all workout intensities to " +
                                std::to_string(static_cast<int>(std::lround(factor * 100.0))) + "%";
        record.affectedCategories = {HealthCategory::Fitness};
        record.reasoning = "Based on current fatigue indicators, reducing intensity to support recovery";
        out.adaptations.push_back(std::move(record));
    }

    const DomainDecision* fitness = current.decisionFor(HealthCategory::Fitness);
    if (fitness && fitness->action == DecisionAction::Skip) {
        auto it = std::find_if(out.tasks.begin(), out.tasks.end(),
                               [](const PlannedTask& t) { return t.category == HealthCategory::Fitness; });
        if (it != out.tasks.end()) {
            *it = PlannedTask{HealthCategory::Fitness, "Recovery workout", std::min(30, it->durationMinutes), 0.4,
                              "Lighter workout following rest day"};
        }
    }
}

void PlanAdjuster::applyPatterns(const PatternDetector& detector, PlanAdjustment& out,
                                 std::chrono::system_clock::time_point now) const {
    for (auto category : kAllCategories) {
        const double rate = detector.skipFrequency(category);
        if (rate <= kSkipPatternThreshold) continue;

        const std::string name = CategoryToString(category);
        auto it = std::find_if(out.tasks.begin(), out.tasks.end(),
                               [category](const PlannedTask& t) { return t.category == category; });
        if (it != out.tasks.end()) {
            it->name = "Flexible " + it->name;
            it->durationMinutes = std::max(1, static_cast<int>(it->durationMinutes * kFlexibleScale));
            it->intensity = std::clamp(it->intensity * kFlexibleScale, 0.0, 1.0);
            it->description = "Adjusted based on adherence patterns: " + it->description;
        }

        AdaptationRecord record;
        record.timestamp = toMillis(now);
        record.patternDetected = "consistent_skip_" + name;
        record.adaptationMade = "Reduced " + name + " expectations by 30%";
        record.affectedCategories = {category};
        record.reasoning = name + " is skipped " + std::to_string(static_cast<int>(std::lround(rate * 100.0))) +
                           "% of the time - adjusting to more realistic targets";
        out.adaptations.push_back(std::move(record));
    }

    if (detector.constraintCount(ConstraintKind::HighStress) >= kChronicStressDays) {
        AdaptationRecord record;
        record.timestamp = toMillis(now);
        record.patternDetected = "chronic_high_stress";
        record.adaptationMade = "Increased mindfulness allocation, reduced fitness intensity";
        record.affectedCategories = {HealthCategory::Mindfulness, HealthCategory::Fitness};
        record.reasoning = "Persistent high stress pattern - rebalancing priorities for stress management";
        out.adaptations.push_back(std::move(record));
    }

    if (detector.constraintCount(ConstraintKind::LowSleep) >= kChronicLowSleepDays) {
        AdaptationRecord record;
        record.timestamp = toMillis(now);
        record.patternDetected = "chronic_sleep_deficit";
        record.adaptationMade = "Recommend sleep hygiene review and reduced evening activities";
        record.affectedCategories = {HealthCategory::Recovery};
        record.reasoning = "Consistent sleep issues detected - systemic adjustment recommended";
        out.adaptations.push_back(std::move(record));
    }
}

WeeklyAdjustmentReport PlanAdjuster::weeklyReport(const std::vector<TradeOffDecision>& history,
                                                  int adaptationsMade,
                                                  std::chrono::system_clock::time_point now) const {
    PatternDetector detector(history, m_windowDays, now);

    WeeklyAdjustmentReport report;
    report.windowDays = detector.windowDays();
    report.status = detector.status();
    report.totalDecisions = static_cast<int>(detector.decisionsInWindow());
    if (report.status != PatternStatus::Ok) {
        return report;
    }

    report.constraintFrequency = detector.constraintCounts();
    report.weekdays = detector.weekdayBreakdown();
    report.adaptationsMade = adaptationsMade;

    for (auto category : kAllCategories) {
        CategoryRates rates;
        rates.skipRate = roundedPercent(detector.skipFrequency(category));
        rates.downgradeRate = roundedPercent(detector.downgradeFrequency(category));
        report.categories[category] = rates;

        const std::string name = CategoryToString(category);
        if (rates.skipRate > 40.0) {
            report.recommendations.push_back("Consider reducing " + name +
                                             " targets - current plan may be too ambitious");
        } else if (rates.downgradeRate > 60.0) {
            report.recommendations.push_back(name + " frequently downgraded - consider adjusting default intensity");
        }
    }

    auto stress = report.constraintFrequency.find("high_stress");
    if (stress != report.constraintFrequency.end() && stress->second >= kChronicStressDays) {
        report.recommendations.push_back("High stress is frequent - consider adding more recovery buffers");
    }
    return report;
}

} // namespace equilibra::domain::services
