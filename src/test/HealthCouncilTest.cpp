#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include "domain/services/HealthCouncil.hpp"

using namespace equilibra::domain;
using namespace equilibra::domain::services;

namespace {

AgentRecommendation makeVote(AgentRole role, CouncilAction action, double confidence) {
    AgentRecommendation r;
    r.agent = role;
    r.action = action;
    r.confidence = confidence;
    r.reasoning = AgentDisplayName(role) + " says " + CouncilActionToString(action);
    return r;
}

TradeOffDecision decisionWith(DecisionAction action) {
    TradeOffDecision d;
    DomainDecision dec;
    dec.category = HealthCategory::Fitness;
    dec.action = action;
    d.decisions.push_back(dec);
    return d;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HealthCouncil Test..." << std::endl;
    HealthCouncil council;
    assert(council.agentCount() == 4);

    std::cout << "[Test] Tired and stressed before HIIT..." << std::endl;
    {
        StateSnapshot s;
        s.sleepHours = 5.0;
        s.energyLevel = 3;
        s.stressLevel = StressLevel::High;
        auto result = council.deliberate(s, "HIIT workout", "Build endurance", {});
        assert(result.finalAction == CouncilAction::Skip);
        assert(std::fabs(result.consensusLevel - 1.8 / 3.3) < 1e-9);
        assert(result.votes.size() == 4);
        assert(result.dissentingOpinions.size() == 2);
        assert(result.reasoningSummary.rfind("Council Decision (55% consensus): SKIP", 0) == 0);

        // Parallel and sequential evaluation agree.
        auto sequential = council.deliberate(s, "HIIT workout", "Build endurance", {}, EvaluationMode::Sequential);
        assert(sequential.finalAction == result.finalAction);
        assert(sequential.consensusLevel == result.consensusLevel);
        assert(sequential.dissentingOpinions == result.dissentingOpinions);
        for (size_t i = 0; i < result.votes.size(); ++i) {
            assert(result.votes[i].agent == sequential.votes[i].agent);
            assert(result.votes[i].action == sequential.votes[i].action);
        }
    }

    std::cout << "[Test] Rested and energetic..." << std::endl;
    {
        StateSnapshot s;
        s.sleepHours = 8.0;
        s.energyLevel = 8;
        s.stressLevel = StressLevel::Low;
        auto result = council.deliberate(s, "Morning exercise", "Stay fit", {});
        assert(result.finalAction == CouncilAction::Proceed);
        assert(std::fabs(result.consensusLevel - 1.0) < 1e-9);
        assert(result.dissentingOpinions.empty());
    }

    // Wellness only objects to extra cognitive load under high stress.
    {
        CouncilContext ctx;
        ctx.state.stressLevel = StressLevel::High;
        ctx.activity = "Gentle yoga";
        const auto calm = WellnessGuardianAgent().recommend(ctx);
        assert(calm.action == CouncilAction::Proceed);
        assert(std::fabs(calm.confidence - 0.75) < 1e-9);

        ctx.activity = "Deadline push";
        assert(WellnessGuardianAgent().recommend(ctx).action == CouncilAction::Skip);

        ctx.state.stressLevel = StressLevel::Medium;
        ctx.activity = "Gentle yoga";
        assert(WellnessGuardianAgent().recommend(ctx).action == CouncilAction::Modify);
    }

    // Keyword matching ignores case.
    assert(MentionsAny("Intense Intervals", {"intense"}));
    assert(!MentionsAny("Yoga", {"hiit", "intense"}));

    std::cout << "[Test] Future self reacts to the recent skip rate..." << std::endl;
    {
        std::vector<TradeOffDecision> history;
        for (int i = 0; i < 7; ++i) {
            history.push_back(decisionWith(i < 4 ? DecisionAction::Skip : DecisionAction::Maintain));
        }
        assert(std::fabs(FutureSelfAgent::RecentSkipRate(history) - 4.0 / 7.0) < 1e-9);

        FutureSelfAgent agent;
        auto vote = agent.recommend({StateSnapshot{}, "Run", "", history});
        assert(vote.action == CouncilAction::Proceed);
        assert(vote.reasoning.find("habit collapse") != std::string::npos);

        history.erase(history.begin());   // 3 of 6
        history.push_back(decisionWith(DecisionAction::Maintain));   // 3 of 7
        vote = agent.recommend({StateSnapshot{}, "Run", "", history});
        assert(vote.action == CouncilAction::Modify);

        vote = agent.recommend({StateSnapshot{}, "Run", "", {}});
        assert(vote.action == CouncilAction::Proceed);
        assert(std::fabs(vote.confidence - 0.80) < 1e-9);
    }

    std::cout << "[Test] Consensus is independent of vote order..." << std::endl;
    {
        std::vector<AgentRecommendation> votes = {
            makeVote(AgentRole::Sleep, CouncilAction::Modify, 0.5),
            makeVote(AgentRole::Performance, CouncilAction::Proceed, 0.5),
            makeVote(AgentRole::Wellness, CouncilAction::Proceed, 0.0),
            makeVote(AgentRole::Future, CouncilAction::Modify, 0.0)};

        std::vector<AgentRecommendation> permutation = votes;
        std::sort(permutation.begin(), permutation.end(), [](const auto& a, const auto& b) {
            return static_cast<int>(a.agent) < static_cast<int>(b.agent);
        });
        const auto reference = HealthCouncil::reachConsensus(votes);
        // Exact tie: the first action in declared role order wins.
        assert(reference.finalAction == CouncilAction::Modify);
        assert(std::fabs(reference.consensusLevel - 0.5) < 1e-9);

        do {
            auto result = HealthCouncil::reachConsensus(permutation);
            assert(result.finalAction == reference.finalAction);
            assert(result.consensusLevel == reference.consensusLevel);
            assert(result.dissentingOpinions == reference.dissentingOpinions);
        } while (std::next_permutation(permutation.begin(), permutation.end(), [](const auto& a, const auto& b) {
            return static_cast<int>(a.agent) < static_cast<int>(b.agent);
        }));
    }

    // No confidence at all.
    {
        auto empty = HealthCouncil::reachConsensus({});
        assert(empty.finalAction == CouncilAction::Proceed);
        assert(empty.consensusLevel == 0.0);

        auto zero = HealthCouncil::reachConsensus({makeVote(AgentRole::Wellness, CouncilAction::Skip, 0.0),
                                                   makeVote(AgentRole::Future, CouncilAction::Modify, 0.0)});
        assert(zero.consensusLevel == 0.0);
        assert(zero.finalAction == CouncilAction::Skip);
    }

    std::cout << "[PASS] HealthCouncil Test Passed" << std::endl;
    return 0;
}
