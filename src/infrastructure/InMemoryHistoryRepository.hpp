/**
 * @file InMemoryHistoryRepository.hpp
 * @brief Volatile HistoryRepository used by simulations and tests.
 */

#pragma once

#include <algorithm>
#include <mutex>
#include <vector>
#include "domain/HistoryRepository.hpp"

namespace equilibra::infrastructure {

class InMemoryHistoryRepository : public domain::HistoryRepository {
public:
    explicit InMemoryHistoryRepository(size_t historyLimit = 50)
        : m_historyLimit(std::max<size_t>(1, historyLimit)) {}

    std::vector<domain::TradeOffDecision> getHistory() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history;
    }

    void appendDecision(const domain::TradeOffDecision& decision) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push_back(decision);
        if (m_history.size() > m_historyLimit) {
            m_history.erase(m_history.begin(), m_history.end() - static_cast<long>(m_historyLimit));
        }
    }

    void clearHistory() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.clear();
        m_adaptations.clear();
    }

    std::vector<domain::AdaptationRecord> getAdaptations() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_adaptations;
    }

    void appendAdaptations(const std::vector<domain::AdaptationRecord>& records) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_adaptations.insert(m_adaptations.end(), records.begin(), records.end());
    }

    domain::UserProfile getProfile() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_profile;
    }

    void saveProfile(const domain::UserProfile& profile) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_profile = profile;
    }

private:
    size_t m_historyLimit;
    std::mutex m_mutex;
    std::vector<domain::TradeOffDecision> m_history;
    std::vector<domain::AdaptationRecord> m_adaptations;
    domain::UserProfile m_profile;
};

} // namespace equilibra::infrastructure
