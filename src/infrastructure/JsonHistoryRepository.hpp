/**
 * @file JsonHistoryRepository.hpp
 * @brief Single-file JSON implementation of the HistoryRepository.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/HistoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace equilibra::infrastructure {

/**
 * @class JsonHistoryRepository
 * @brief Keeps store.json in memory and writes it through PersistenceService.
 *
 * Layout: { "history": [...], "adaptations": [...], "profile": {...} }.
 * Records that fail to decode on load are reported and skipped.
 */
class JsonHistoryRepository : public domain::HistoryRepository {
public:
    static constexpr const char* kStoreFile = "store.json";

    JsonHistoryRepository(const std::string& dataDir,
                          std::shared_ptr<PersistenceService> persistence,
                          size_t historyLimit = 50);

    std::vector<domain::TradeOffDecision> getHistory() override;
    void appendDecision(const domain::TradeOffDecision& decision) override;
    void clearHistory() override;

    std::vector<domain::AdaptationRecord> getAdaptations() override;
    void appendAdaptations(const std::vector<domain::AdaptationRecord>& records) override;

    domain::UserProfile getProfile() override;
    void saveProfile(const domain::UserProfile& profile) override;

    /** @brief Records skipped while loading because they failed to decode. */
    int skippedOnLoad() const { return m_skippedOnLoad; }

private:
    void load();
    /** @brief Serializes the in-memory state and queues it. Caller holds m_mutex. */
    void persistLocked();

    std::string m_storePath;
    std::shared_ptr<PersistenceService> m_persistence;
    size_t m_historyLimit;

    std::mutex m_mutex;
    std::vector<domain::TradeOffDecision> m_history;
    std::vector<domain::AdaptationRecord> m_adaptations;
    domain::UserProfile m_profile;
    int m_skippedOnLoad = 0;
};

} // namespace equilibra::infrastructure
