/**
 * @file Council.hpp
 * @brief Value types exchanged by the multi-agent health council.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Category.hpp"

namespace equilibra::domain {

/**
 * @enum CouncilAction
 * @brief What an agent recommends for a single proposed activity.
 */
enum class CouncilAction {
    Proceed,
    Modify,
    Skip
};

inline std::string CouncilActionToString(CouncilAction action) {
    switch (action) {
        case CouncilAction::Proceed: return "PROCEED";
        case CouncilAction::Modify: return "MODIFY";
        case CouncilAction::Skip: return "SKIP";
    }
    return "PROCEED";
}

inline CouncilAction CouncilActionFromString(const std::string& value) {
    if (value == "PROCEED") return CouncilAction::Proceed;
    if (value == "MODIFY") return CouncilAction::Modify;
    if (value == "SKIP") return CouncilAction::Skip;
    throw std::invalid_argument("Unknown council action: " + value);
}

/**
 * @enum AgentRole
 * @brief The four fixed council seats, in declared order.
 */
enum class AgentRole {
    Sleep,
    Performance,
    Wellness,
    Future
};

inline std::string AgentRoleToString(AgentRole role) {
    switch (role) {
        case AgentRole::Sleep: return "sleep";
        case AgentRole::Performance: return "performance";
        case AgentRole::Wellness: return "wellness";
        case AgentRole::Future: return "future";
    }
    return "sleep";
}

inline AgentRole AgentRoleFromString(const std::string& value) {
    if (value == "sleep") return AgentRole::Sleep;
    if (value == "performance") return AgentRole::Performance;
    if (value == "wellness") return AgentRole::Wellness;
    if (value == "future") return AgentRole::Future;
    throw std::invalid_argument("Unknown agent role: " + value);
}

/** @brief Display name used in council summaries. */
inline std::string AgentDisplayName(AgentRole role) {
    switch (role) {
        case AgentRole::Sleep: return "Sleep Specialist";
        case AgentRole::Performance: return "Performance Coach";
        case AgentRole::Wellness: return "Wellness Guardian";
        case AgentRole::Future: return "Future Self";
    }
    return {};
}

struct AgentRecommendation {
    AgentRole agent = AgentRole::Sleep;
    CouncilAction action = CouncilAction::Proceed;
    std::string reasoning;
    double confidence = 0.0;            ///< Within [0, 1].
    CategoryWeights categoryWeights;    ///< Hints only, may be empty.
};

/**
 * @struct ConsensusDecision
 * @brief Weighted-majority outcome of a council deliberation.
 */
struct ConsensusDecision {
    CouncilAction finalAction = CouncilAction::Proceed;
    double consensusLevel = 0.0;
    std::vector<AgentRecommendation> votes;   ///< In declared role order.
    std::string reasoningSummary;
    std::vector<std::string> dissentingOpinions;
};

} // namespace equilibra::domain
