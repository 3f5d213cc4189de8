/**
 * @file DecisionLogStore.cpp
 * @brief Implementation of DecisionLogStore.
 */

#include "infrastructure/DecisionLogStore.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace equilibra::infrastructure {

namespace fs = std::filesystem;

DecisionLogStore::DecisionLogStore(const std::string& logDir, std::shared_ptr<PersistenceService> persistence)
    : m_logDir(logDir), m_persistence(std::move(persistence)) {}

std::string DecisionLogStore::pathFor(const std::string& decisionId) const {
    return (fs::path(m_logDir) / ("decision_" + decisionId + ".json")).string();
}

void DecisionLogStore::logDecision(const domain::TradeOffDecision& decision,
                                   const std::optional<domain::DecisionNarrative>& narrative) {
    json j = decision;
    if (narrative) {
        j["narrative"] = *narrative;
    }
    m_persistence->saveTextAsync(pathFor(decision.id), DumpJson(j, 2));

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessionDecisions.push_back(decision);
}

void DecisionLogStore::logAdaptations(const std::vector<domain::AdaptationRecord>& records) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessionAdaptations.insert(m_sessionAdaptations.end(), records.begin(), records.end());
}

std::string DecisionLogStore::exportSession() {
    const auto now = std::chrono::system_clock::now();
    const std::string path = (fs::path(m_logDir) / ("session_" + std::to_string(ToEpochMillis(now)) + ".json")).string();

    json j;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        j = {
            {"exported_at", ToEpochMillis(now)},
            {"decision_count", m_sessionDecisions.size()},
            {"decisions", m_sessionDecisions},
            {"adaptations", m_sessionAdaptations}
        };
    }
    m_persistence->saveTextAsync(path, DumpJson(j, 2));
    std::cout << "[DecisionLogStore] Session exported to " << path << std::endl;
    return path;
}

std::optional<domain::TradeOffDecision> DecisionLogStore::loadDecision(const std::string& id) const {
    const std::string path = pathFor(id);
    if (!fs::exists(path)) return std::nullopt;

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return j.get<domain::TradeOffDecision>();
    } catch (const json::exception& e) {
        std::cerr << "[DecisionLogStore] Malformed log " << path << ": " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[DecisionLogStore] Malformed log " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

size_t DecisionLogStore::sessionDecisionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessionDecisions.size();
}

} // namespace equilibra::infrastructure
