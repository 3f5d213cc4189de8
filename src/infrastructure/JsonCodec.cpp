/**
 * @file JsonCodec.cpp
 * @brief Implementation of the JSON mappings.
 */

#include "infrastructure/JsonCodec.hpp"

namespace equilibra::infrastructure {

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::string DumpJson(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json WeightsToJson(const domain::CategoryWeights& weights) {
    json j = json::object();
    for (const auto& [category, value] : weights) {
        j[domain::CategoryToString(category)] = value;
    }
    return j;
}

domain::CategoryWeights WeightsFromJson(const json& j) {
    domain::CategoryWeights weights;
    for (auto it = j.begin(); it != j.end(); ++it) {
        weights[domain::CategoryFromString(it.key())] = it.value().get<double>();
    }
    return weights;
}

} // namespace equilibra::infrastructure

namespace equilibra::domain {

using infrastructure::FromEpochMillis;
using infrastructure::ToEpochMillis;
using json = nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

} // namespace

// StateSnapshot

void to_json(json& j, const StateSnapshot& s) {
    j = {
        {"timestamp", ToEpochMillis(s.timestamp)},
        {"sleep_hours", s.sleepHours},
        {"energy_level", s.energyLevel},
        {"stress_level", StressToString(s.stressLevel)},
        {"time_available_hours", s.timeAvailableHours},
        {"sleep_debt_hours", s.sleepDebtHours},
        {"consecutive_high_effort_days", s.consecutiveHighEffortDays},
        {"sleep_quality", optionalToJson(s.sleepQuality)},
        {"hrv_ms", optionalToJson(s.hrvMs)},
        {"resting_heart_rate", optionalToJson(s.restingHeartRate)}
    };
}

void from_json(const json& j, StateSnapshot& s) {
    s.timestamp = FromEpochMillis(j.value("timestamp", std::int64_t{0}));
    s.sleepHours = j.at("sleep_hours").get<double>();
    s.energyLevel = j.at("energy_level").get<int>();
    s.stressLevel = StressFromString(j.at("stress_level").get<std::string>());
    s.timeAvailableHours = j.at("time_available_hours").get<double>();
    s.sleepDebtHours = j.value("sleep_debt_hours", 0.0);
    s.consecutiveHighEffortDays = j.value("consecutive_high_effort_days", 0);
    s.sleepQuality = optionalFromJson<double>(j, "sleep_quality");
    s.hrvMs = optionalFromJson<double>(j, "hrv_ms");
    s.restingHeartRate = optionalFromJson<int>(j, "resting_heart_rate");
}

// Constraint

void to_json(json& j, const Constraint& c) {
    j = {
        {"name", ConstraintKindToString(c.kind)},
        {"severity", c.severity},
        {"description", c.description},
        {"source", ConstraintSourceToString(c.source)}
    };
}

void from_json(const json& j, Constraint& c) {
    c.kind = ConstraintKindFromString(j.at("name").get<std::string>());
    c.severity = j.at("severity").get<double>();
    c.description = j.value("description", ConstraintDescription(c.kind));
    c.source = ConstraintSourceFromString(j.value("source", std::string("derived")));
}

// PlannedTask

void to_json(json& j, const PlannedTask& t) {
    j = {
        {"category", CategoryToString(t.category)},
        {"name", t.name},
        {"duration_minutes", t.durationMinutes},
        {"intensity", t.intensity},
        {"description", t.description}
    };
}

void from_json(const json& j, PlannedTask& t) {
    t.category = CategoryFromString(j.at("category").get<std::string>());
    t.name = j.at("name").get<std::string>();
    t.durationMinutes = j.at("duration_minutes").get<int>();
    t.intensity = j.at("intensity").get<double>();
    t.description = j.value("description", std::string());
}

// DomainDecision

void to_json(json& j, const DomainDecision& d) {
    j = {
        {"category", CategoryToString(d.category)},
        {"action", ActionToString(d.action)},
        {"original_task", d.originalTask},
        {"adjusted_task", optionalToJson(d.adjustedTask)},
        {"reasoning", d.reasoning},
        {"priority_score", d.priorityScore}
    };
}

void from_json(const json& j, DomainDecision& d) {
    d.category = CategoryFromString(j.at("category").get<std::string>());
    d.action = ActionFromString(j.at("action").get<std::string>());
    d.originalTask = j.at("original_task").get<PlannedTask>();
    d.adjustedTask = optionalFromJson<PlannedTask>(j, "adjusted_task");
    d.reasoning = j.value("reasoning", std::string());
    d.priorityScore = j.value("priority_score", 0.0);
}

// FutureImpact

void to_json(json& j, const FutureImpact& f) {
    j = {
        {"days_affected", f.daysAffected},
        {"adjustment_type", f.adjustmentType},
        {"description", f.description}
    };
}

void from_json(const json& j, FutureImpact& f) {
    f.daysAffected = j.at("days_affected").get<int>();
    f.adjustmentType = j.at("adjustment_type").get<std::string>();
    f.description = j.value("description", std::string());
}

// PriorityAdjustment

void to_json(json& j, const PriorityAdjustment& p) {
    j = {
        {"category", CategoryToString(p.category)},
        {"source", p.source},
        {"delta", p.delta}
    };
}

void from_json(const json& j, PriorityAdjustment& p) {
    p.category = CategoryFromString(j.at("category").get<std::string>());
    p.source = j.at("source").get<std::string>();
    p.delta = j.at("delta").get<double>();
}

// TradeOffDecision

void to_json(json& j, const TradeOffDecision& d) {
    json constraints = json::array();
    for (auto kind : d.activeConstraints) {
        constraints.push_back(ConstraintKindToString(kind));
    }
    j = {
        {"id", d.id},
        {"timestamp", ToEpochMillis(d.timestamp)},
        {"state", d.state},
        {"constraints_active", constraints},
        {"priority_adjustments", d.priorityAdjustments},
        {"priorities", infrastructure::WeightsToJson(d.priorities)},
        {"decisions", d.decisions},
        {"future_impacts", d.futureImpacts},
        {"confidence_score", d.confidenceScore},
        {"reasoning_summary", d.reasoningSummary}
    };
}

void from_json(const json& j, TradeOffDecision& d) {
    d.id = j.at("id").get<std::string>();
    d.timestamp = FromEpochMillis(j.at("timestamp").get<std::int64_t>());
    d.state = j.at("state").get<StateSnapshot>();
    d.activeConstraints.clear();
    for (const auto& name : j.at("constraints_active")) {
        d.activeConstraints.push_back(ConstraintKindFromString(name.get<std::string>()));
    }
    d.priorityAdjustments = j.value("priority_adjustments", std::vector<PriorityAdjustment>{});
    d.priorities = j.contains("priorities") ? infrastructure::WeightsFromJson(j.at("priorities")) : CategoryWeights{};
    d.decisions = j.at("decisions").get<std::vector<DomainDecision>>();
    d.futureImpacts = j.value("future_impacts", std::vector<FutureImpact>{});
    d.confidenceScore = j.at("confidence_score").get<double>();
    d.reasoningSummary = j.value("reasoning_summary", std::string());
}

// AgentRecommendation

void to_json(json& j, const AgentRecommendation& r) {
    j = {
        {"agent", AgentRoleToString(r.agent)},
        {"action", CouncilActionToString(r.action)},
        {"reasoning", r.reasoning},
        {"confidence", r.confidence},
        {"category_weights", infrastructure::WeightsToJson(r.categoryWeights)}
    };
}

void from_json(const json& j, AgentRecommendation& r) {
    r.agent = AgentRoleFromString(j.at("agent").get<std::string>());
    r.action = CouncilActionFromString(j.at("action").get<std::string>());
    r.reasoning = j.value("reasoning", std::string());
    r.confidence = j.at("confidence").get<double>();
    r.categoryWeights = j.contains("category_weights") ? infrastructure::WeightsFromJson(j.at("category_weights"))
                                                       : CategoryWeights{};
}

// ConsensusDecision

void to_json(json& j, const ConsensusDecision& c) {
    j = {
        {"final_action", CouncilActionToString(c.finalAction)},
        {"consensus_level", c.consensusLevel},
        {"agent_votes", c.votes},
        {"reasoning_summary", c.reasoningSummary},
        {"dissenting_opinions", c.dissentingOpinions}
    };
}

void from_json(const json& j, ConsensusDecision& c) {
    c.finalAction = CouncilActionFromString(j.at("final_action").get<std::string>());
    c.consensusLevel = j.at("consensus_level").get<double>();
    c.votes = j.at("agent_votes").get<std::vector<AgentRecommendation>>();
    c.reasoningSummary = j.value("reasoning_summary", std::string());
    c.dissentingOpinions = j.value("dissenting_opinions", std::vector<std::string>{});
}

// BurnoutForecast

void to_json(json& j, const BurnoutForecast& f) {
    j = {
        {"risk_score", f.riskScore},
        {"days_to_crisis", optionalToJson(f.daysToCrisis)},
        {"primary_factors", f.primaryFactors},
        {"intervention_needed", f.interventionNeeded},
        {"severity", SeverityToString(f.severity)}
    };
}

void from_json(const json& j, BurnoutForecast& f) {
    f.riskScore = j.at("risk_score").get<int>();
    f.daysToCrisis = optionalFromJson<int>(j, "days_to_crisis");
    f.primaryFactors = j.at("primary_factors").get<std::vector<std::string>>();
    f.interventionNeeded = j.value("intervention_needed", false);
    f.severity = SeverityFromString(j.at("severity").get<std::string>());
}

// AdaptationRecord

void to_json(json& j, const AdaptationRecord& a) {
    json categories = json::array();
    for (auto c : a.affectedCategories) {
        categories.push_back(CategoryToString(c));
    }
    j = {
        {"timestamp", ToEpochMillis(a.timestamp)},
        {"pattern_detected", a.patternDetected},
        {"adaptation_made", a.adaptationMade},
        {"affected_categories", categories},
        {"reasoning", a.reasoning}
    };
}

void from_json(const json& j, AdaptationRecord& a) {
    a.timestamp = FromEpochMillis(j.at("timestamp").get<std::int64_t>());
    a.patternDetected = j.at("pattern_detected").get<std::string>();
    a.adaptationMade = j.value("adaptation_made", std::string());
    a.affectedCategories.clear();
    for (const auto& name : j.value("affected_categories", json::array())) {
        a.affectedCategories.push_back(CategoryFromString(name.get<std::string>()));
    }
    a.reasoning = j.value("reasoning", std::string());
}

// Thresholds and profile

void to_json(json& j, const ConstraintThresholds& t) {
    j = {
        {"min_sleep_hours", t.minSleepHours},
        {"critical_sleep_hours", t.criticalSleepHours},
        {"low_energy", t.lowEnergy},
        {"critical_energy", t.criticalEnergy},
        {"min_time_hours", t.minTimeHours},
        {"limited_time_hours", t.limitedTimeHours},
        {"max_consecutive_high_effort_days", t.maxConsecutiveHighEffortDays},
        {"sleep_debt_warning_hours", t.sleepDebtWarningHours},
        {"sleep_debt_critical_hours", t.sleepDebtCriticalHours}
    };
}

void from_json(const json& j, ConstraintThresholds& t) {
    const ConstraintThresholds d;
    t.minSleepHours = j.value("min_sleep_hours", d.minSleepHours);
    t.criticalSleepHours = j.value("critical_sleep_hours", d.criticalSleepHours);
    t.lowEnergy = j.value("low_energy", d.lowEnergy);
    t.criticalEnergy = j.value("critical_energy", d.criticalEnergy);
    t.minTimeHours = j.value("min_time_hours", d.minTimeHours);
    t.limitedTimeHours = j.value("limited_time_hours", d.limitedTimeHours);
    t.maxConsecutiveHighEffortDays = j.value("max_consecutive_high_effort_days", d.maxConsecutiveHighEffortDays);
    t.sleepDebtWarningHours = j.value("sleep_debt_warning_hours", d.sleepDebtWarningHours);
    t.sleepDebtCriticalHours = j.value("sleep_debt_critical_hours", d.sleepDebtCriticalHours);
}

void to_json(json& j, const UserProfile& p) {
    j = {
        {"user_id", p.userId},
        {"name", p.name},
        {"primary_goal", p.primaryGoal},
        {"thresholds", p.thresholds},
        {"preferences", p.preferences ? infrastructure::WeightsToJson(*p.preferences) : json(nullptr)}
    };
}

void from_json(const json& j, UserProfile& p) {
    p.userId = j.value("user_id", std::string("default"));
    p.name = j.value("name", std::string());
    p.primaryGoal = j.value("primary_goal", std::string());
    p.thresholds = j.contains("thresholds") ? j.at("thresholds").get<ConstraintThresholds>() : ConstraintThresholds{};
    // A missing key keeps the uniform default; an explicit null turns the blend off.
    if (j.contains("preferences")) {
        if (j.at("preferences").is_null()) {
            p.preferences.reset();
        } else {
            p.preferences = infrastructure::WeightsFromJson(j.at("preferences"));
        }
    }
}

// Narrative

void to_json(json& j, const DecisionNarrative& n) {
    j = {
        {"explanation", n.explanation},
        {"temporal_analysis", n.temporalAnalysis},
        {"context_assessment", n.contextAssessment},
        {"generated_by_model", n.generatedByModel}
    };
}

void from_json(const json& j, DecisionNarrative& n) {
    n.explanation = j.at("explanation").get<std::string>();
    n.temporalAnalysis = j.value("temporal_analysis", std::string());
    n.contextAssessment = j.value("context_assessment", std::string());
    n.generatedByModel = j.value("generated_by_model", false);
}

void to_json(json& j, const WeeklyAdjustmentReport& r) {
    json categories = json::object();
    for (const auto& [category, rates] : r.categories) {
        categories[CategoryToString(category)] = {
            {"skip_rate", rates.skipRate},
            {"downgrade_rate", rates.downgradeRate}
        };
    }
    json weekdays = json::array();
    for (const auto& day : r.weekdays) {
        weekdays.push_back({
            {"decisions", day.decisions},
            {"constraints", day.constraints},
            {"skips", day.skips},
            {"avg_constraints", day.avgConstraints},
            {"skip_rate", day.skipRate}
        });
    }
    j = {
        {"status", PatternStatusToString(r.status)},
        {"period_days", r.windowDays},
        {"total_decisions", r.totalDecisions},
        {"categories", categories},
        {"constraint_frequency", r.constraintFrequency},
        {"day_patterns", weekdays},
        {"adaptations_made", r.adaptationsMade},
        {"recommendations", r.recommendations}
    };
}

} // namespace equilibra::domain
