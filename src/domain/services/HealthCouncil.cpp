/**
 * @file HealthCouncil.cpp
 * @brief Implementation of HealthCouncil.
 */

#include "domain/services/HealthCouncil.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <utility>

namespace equilibra::domain::services {

HealthCouncil::HealthCouncil() {
    m_agents.push_back(std::make_unique<SleepSpecialistAgent>());
    m_agents.push_back(std::make_unique<PerformanceCoachAgent>());
    m_agents.push_back(std::make_unique<WellnessGuardianAgent>());
    m_agents.push_back(std::make_unique<FutureSelfAgent>());
}

HealthCouncil::HealthCouncil(std::vector<std::unique_ptr<CouncilAgent>> agents)
    : m_agents(std::move(agents)) {}

ConsensusDecision HealthCouncil::deliberate(const StateSnapshot& state,
                                            const std::string& activity,
                                            const std::string& goal,
                                            const std::vector<TradeOffDecision>& history,
                                            EvaluationMode mode) const {
    const CouncilContext context{state.clamped(), activity, goal, history};

    std::vector<AgentRecommendation> votes;
    votes.reserve(m_agents.size());

    if (mode == EvaluationMode::Parallel) {
        std::vector<std::future<AgentRecommendation>> pending;
        pending.reserve(m_agents.size());
        for (const auto& agent : m_agents) {
            const CouncilAgent* voter = agent.get();
            pending.push_back(std::async(std::launch::async,
                                         [voter, &context] { return voter->recommend(context); }));
        }
        for (auto& f : pending) {
            votes.push_back(f.get());
        }
    } else {
        for (const auto& agent : m_agents) {
            votes.push_back(agent->recommend(context));
        }
    }

    return reachConsensus(std::move(votes));
}

ConsensusDecision HealthCouncil::reachConsensus(std::vector<AgentRecommendation> votes) {
    std::stable_sort(votes.begin(), votes.end(), [](const AgentRecommendation& a, const AgentRecommendation& b) {
        return static_cast<int>(a.agent) < static_cast<int>(b.agent);
    });

    // Sums kept in first-seen order for the tie-break.
    std::vector<std::pair<CouncilAction, double>> sums;
    double total = 0.0;
    for (const auto& v : votes) {
        const double confidence = std::clamp(v.confidence, 0.0, 1.0);
        total += confidence;
        auto it = std::find_if(sums.begin(), sums.end(),
                               [&v](const auto& entry) { return entry.first == v.action; });
        if (it == sums.end()) {
            sums.emplace_back(v.action, confidence);
        } else {
            it->second += confidence;
        }
    }

    ConsensusDecision result;
    double winning = 0.0;
    if (!sums.empty()) {
        result.finalAction = sums.front().first;
        winning = sums.front().second;
        for (const auto& [action, sum] : sums) {
            if (sum > winning) {
                winning = sum;
                result.finalAction = action;
            }
        }
    }
    result.consensusLevel = total > 0.0 ? std::clamp(winning / total, 0.0, 1.0) : 0.0;

    const std::string actionName = CouncilActionToString(result.finalAction);
    result.reasoningSummary = "Council Decision (" +
                              std::to_string(static_cast<int>(std::lround(result.consensusLevel * 100.0))) +
                              "% consensus): " + actionName;
    for (const auto& v : votes) {
        const std::string line = AgentRoleToString(v.agent) + ": " + v.reasoning;
        if (v.action == result.finalAction) {
            result.reasoningSummary += "\n- " + line;
        } else {
            result.dissentingOpinions.push_back(line);
        }
    }

    result.votes = std::move(votes);
    return result;
}

} // namespace equilibra::domain::services
