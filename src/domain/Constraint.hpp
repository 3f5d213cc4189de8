/**
 * @file Constraint.hpp
 * @brief Named, severity-weighted limiting conditions derived from a state snapshot.
 */

#pragma once

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace equilibra::domain {

/**
 * @enum ConstraintKind
 * @brief Closed vocabulary of constraint names.
 */
enum class ConstraintKind {
    LowSleep,
    CriticalSleep,
    SleepDebtAccumulated,
    LowEnergy,
    CriticalEnergy,
    HighStress,
    TimeLimited,
    TimeCritical,
    OvertrainingRisk,
    BurnoutWarning
};

inline constexpr ConstraintKind kAllConstraintKinds[] = {
    ConstraintKind::LowSleep,
    ConstraintKind::CriticalSleep,
    ConstraintKind::SleepDebtAccumulated,
    ConstraintKind::LowEnergy,
    ConstraintKind::CriticalEnergy,
    ConstraintKind::HighStress,
    ConstraintKind::TimeLimited,
    ConstraintKind::TimeCritical,
    ConstraintKind::OvertrainingRisk,
    ConstraintKind::BurnoutWarning
};

inline std::string ConstraintKindToString(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::LowSleep: return "low_sleep";
        case ConstraintKind::CriticalSleep: return "critical_sleep";
        case ConstraintKind::SleepDebtAccumulated: return "sleep_debt_accumulated";
        case ConstraintKind::LowEnergy: return "low_energy";
        case ConstraintKind::CriticalEnergy: return "critical_energy";
        case ConstraintKind::HighStress: return "high_stress";
        case ConstraintKind::TimeLimited: return "time_limited";
        case ConstraintKind::TimeCritical: return "time_critical";
        case ConstraintKind::OvertrainingRisk: return "overtraining_risk";
        case ConstraintKind::BurnoutWarning: return "burnout_warning";
    }
    return "low_sleep";
}

/** @throws std::invalid_argument for names outside the vocabulary. */
inline ConstraintKind ConstraintKindFromString(const std::string& value) {
    for (auto kind : kAllConstraintKinds) {
        if (ConstraintKindToString(kind) == value) return kind;
    }
    throw std::invalid_argument("Unknown constraint: " + value);
}

/** @brief Fixed human-readable description for each constraint. */
inline std::string ConstraintDescription(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::LowSleep: return "Sleep below minimum threshold - recovery impaired";
        case ConstraintKind::CriticalSleep: return "Severely sleep deprived - high priority for rest";
        case ConstraintKind::SleepDebtAccumulated: return "Accumulated sleep debt needs addressing";
        case ConstraintKind::LowEnergy: return "Energy levels depleted - reduced capacity for effort";
        case ConstraintKind::CriticalEnergy: return "Energy critically low - only essential activities";
        case ConstraintKind::HighStress: return "Elevated stress - cognitive load impaired";
        case ConstraintKind::TimeLimited: return "Limited time available - must prioritize";
        case ConstraintKind::TimeCritical: return "Minimal time available - only most critical tasks";
        case ConstraintKind::OvertrainingRisk: return "Too many consecutive high-effort days";
        case ConstraintKind::BurnoutWarning: return "Multiple indicators suggest burnout risk";
    }
    return {};
}

/**
 * @enum ConstraintSource
 * @brief Where the evidence for a constraint came from.
 */
enum class ConstraintSource {
    Wearable,
    Derived,
    UserInput
};

inline std::string ConstraintSourceToString(ConstraintSource source) {
    switch (source) {
        case ConstraintSource::Wearable: return "wearable";
        case ConstraintSource::Derived: return "derived";
        case ConstraintSource::UserInput: return "user_input";
    }
    return "derived";
}

inline ConstraintSource ConstraintSourceFromString(const std::string& value) {
    if (value == "wearable") return ConstraintSource::Wearable;
    if (value == "derived") return ConstraintSource::Derived;
    if (value == "user_input") return ConstraintSource::UserInput;
    throw std::invalid_argument("Unknown constraint source: " + value);
}

/**
 * @struct Constraint
 * @brief One active limiting condition.
 */
struct Constraint {
    ConstraintKind kind = ConstraintKind::LowSleep;
    double severity = 0.0;          ///< Always within [0, 1].
    std::string description;
    ConstraintSource source = ConstraintSource::Derived;
};

/**
 * @class ActiveConstraints
 * @brief Set of constraints keyed by kind, remembering insertion order.
 *
 * Adding a kind that is already present replaces the earlier entry.
 */
class ActiveConstraints {
public:
    void add(ConstraintKind kind, double severity, ConstraintSource source,
             std::string description = {}) {
        Constraint c;
        c.kind = kind;
        c.severity = std::clamp(severity, 0.0, 1.0);
        c.description = description.empty() ? ConstraintDescription(kind) : std::move(description);
        c.source = source;

        auto it = std::find_if(m_items.begin(), m_items.end(),
                               [kind](const Constraint& existing) { return existing.kind == kind; });
        if (it != m_items.end()) {
            *it = std::move(c);
        } else {
            m_items.push_back(std::move(c));
        }
    }

    bool has(ConstraintKind kind) const {
        return std::any_of(m_items.begin(), m_items.end(),
                           [kind](const Constraint& c) { return c.kind == kind; });
    }

    bool hasAny(std::initializer_list<ConstraintKind> kinds) const {
        return std::any_of(kinds.begin(), kinds.end(), [this](ConstraintKind k) { return has(k); });
    }

    /** @brief Severity of the given kind, 0 when absent. */
    double severityOf(ConstraintKind kind) const {
        for (const auto& c : m_items) {
            if (c.kind == kind) return c.severity;
        }
        return 0.0;
    }

    double meanSeverity() const {
        if (m_items.empty()) return 0.0;
        double sum = 0.0;
        for (const auto& c : m_items) sum += c.severity;
        return sum / static_cast<double>(m_items.size());
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(m_items.size());
        for (const auto& c : m_items) out.push_back(ConstraintKindToString(c.kind));
        return out;
    }

    const std::vector<Constraint>& items() const { return m_items; }
    bool empty() const { return m_items.empty(); }
    size_t size() const { return m_items.size(); }

private:
    std::vector<Constraint> m_items;
};

} // namespace equilibra::domain
