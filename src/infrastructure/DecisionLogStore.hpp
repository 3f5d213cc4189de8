/**
 * @file DecisionLogStore.hpp
 * @brief Audit log with one JSON file per decision plus session exports.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"
#include "domain/NarrativeService.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace equilibra::infrastructure {

class DecisionLogStore {
public:
    DecisionLogStore(const std::string& logDir, std::shared_ptr<PersistenceService> persistence);

    /** @brief Writes decision_<id>.json, embedding the narrative when one is given. */
    void logDecision(const domain::TradeOffDecision& decision,
                     const std::optional<domain::DecisionNarrative>& narrative = std::nullopt);

    void logAdaptations(const std::vector<domain::AdaptationRecord>& records);

    /**
     * @brief Writes session_<epoch-ms>.json with everything logged so far.
     * @return Path of the export file.
     */
    std::string exportSession();

    /** @brief Reads a logged decision back; nullopt when missing or malformed. */
    std::optional<domain::TradeOffDecision> loadDecision(const std::string& id) const;

    std::string pathFor(const std::string& decisionId) const;

    size_t sessionDecisionCount() const;

private:
    std::string m_logDir;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_mutex;
    std::vector<domain::TradeOffDecision> m_sessionDecisions;
    std::vector<domain::AdaptationRecord> m_sessionAdaptations;
};

} // namespace equilibra::infrastructure
