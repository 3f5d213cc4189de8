/**
 * @file CouncilAgents.hpp
 * @brief The four specialist voters of the health council.
 */

#pragma once

#include <initializer_list>
#include <string>
#include <vector>
#include "domain/Council.hpp"
#include "domain/Decision.hpp"
#include "domain/HealthState.hpp"

namespace equilibra::domain::services {

/**
 * @struct CouncilContext
 * @brief Shared read-only input handed to every agent.
 */
struct CouncilContext {
    StateSnapshot state;
    std::string activity;
    std::string goal;
    std::vector<TradeOffDecision> history;
};

/**
 * @class CouncilAgent
 * @brief One heuristic voter. Implementations hold no mutable state so
 * they can be evaluated concurrently.
 */
class CouncilAgent {
public:
    virtual ~CouncilAgent() = default;
    virtual AgentRole role() const = 0;
    virtual AgentRecommendation recommend(const CouncilContext& context) const = 0;
};

/** @brief Penalizes high-intensity activity after short sleep. */
class SleepSpecialistAgent : public CouncilAgent {
public:
    AgentRole role() const override { return AgentRole::Sleep; }
    AgentRecommendation recommend(const CouncilContext& context) const override;
};

/** @brief Rewards high energy, protects against low energy. */
class PerformanceCoachAgent : public CouncilAgent {
public:
    AgentRole role() const override { return AgentRole::Performance; }
    AgentRecommendation recommend(const CouncilContext& context) const override;
};

/** @brief Weighs stress level against the kind of activity. */
class WellnessGuardianAgent : public CouncilAgent {
public:
    AgentRole role() const override { return AgentRole::Wellness; }
    AgentRecommendation recommend(const CouncilContext& context) const override;
};

/** @brief Looks at recent skip behaviour to protect habits. */
class FutureSelfAgent : public CouncilAgent {
public:
    static constexpr size_t kLookback = 7;

    AgentRole role() const override { return AgentRole::Future; }
    AgentRecommendation recommend(const CouncilContext& context) const override;

    /** @brief Share of the last kLookback entries containing at least one SKIP. */
    static double RecentSkipRate(const std::vector<TradeOffDecision>& history);
};

/** @brief Case-insensitive substring test. */
bool MentionsAny(const std::string& text, std::initializer_list<const char*> keywords);

} // namespace equilibra::domain::services
