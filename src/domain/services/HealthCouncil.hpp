/**
 * @file HealthCouncil.hpp
 * @brief Multi-agent weighted-consensus arbitration for a single activity.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/Council.hpp"
#include "domain/services/CouncilAgents.hpp"

namespace equilibra::domain::services {

enum class EvaluationMode {
    Parallel,    ///< One std::async task per agent.
    Sequential
};

/**
 * @class HealthCouncil
 * @brief Collects one vote per agent and reduces them to a consensus.
 *
 * Independent from the trade-off engine. Both evaluation modes produce
 * identical output.
 */
class HealthCouncil {
public:
    /** @brief Seats the four default agents. */
    HealthCouncil();
    explicit HealthCouncil(std::vector<std::unique_ptr<CouncilAgent>> agents);

    ConsensusDecision deliberate(const StateSnapshot& state,
                                 const std::string& activity,
                                 const std::string& goal,
                                 const std::vector<TradeOffDecision>& history,
                                 EvaluationMode mode = EvaluationMode::Parallel) const;

    /**
     * @brief Weighted majority over summed confidences.
     *
     * Votes are ordered by declared role first, so the input order never
     * matters; exact ties go to the action seen first in that order.
     */
    static ConsensusDecision reachConsensus(std::vector<AgentRecommendation> votes);

    size_t agentCount() const { return m_agents.size(); }

private:
    std::vector<std::unique_ptr<CouncilAgent>> m_agents;
};

} // namespace equilibra::domain::services
