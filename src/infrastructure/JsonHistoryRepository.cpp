/**
 * @file JsonHistoryRepository.cpp
 * @brief Implementation of JsonHistoryRepository.
 */

#include "infrastructure/JsonHistoryRepository.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace equilibra::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string EncodeStore(const std::vector<domain::TradeOffDecision>& history,
                        const std::vector<domain::AdaptationRecord>& adaptations,
                        const domain::UserProfile& profile) {
    json root = {
        {"history", history},
        {"adaptations", adaptations},
        {"profile", profile}
    };
    return DumpJson(root, 2);
}

void TrimTo(std::vector<domain::TradeOffDecision>& history, size_t limit) {
    if (history.size() > limit) {
        history.erase(history.begin(), history.end() - static_cast<long>(limit));
    }
}

} // namespace

JsonHistoryRepository::JsonHistoryRepository(const std::string& dataDir,
                                             std::shared_ptr<PersistenceService> persistence,
                                             size_t historyLimit)
    : m_storePath((fs::path(dataDir) / kStoreFile).string()),
      m_persistence(std::move(persistence)),
      m_historyLimit(std::max<size_t>(1, historyLimit)) {
    load();
}

void JsonHistoryRepository::load() {
    if (!fs::exists(m_storePath)) return;

    json root;
    try {
        std::ifstream f(m_storePath);
        f >> root;
    } catch (const json::exception& e) {
        std::cerr << "[JsonHistoryRepository] Store unreadable, starting empty: " << e.what() << std::endl;
        return;
    }
    if (!root.is_object()) {
        std::cerr << "[JsonHistoryRepository] Store is not a JSON object, starting empty" << std::endl;
        return;
    }

    for (const auto& item : root.value("history", json::array())) {
        try {
            m_history.push_back(item.get<domain::TradeOffDecision>());
        } catch (const json::exception& e) {
            ++m_skippedOnLoad;
            std::cerr << "[JsonHistoryRepository] Skipping malformed decision: " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            ++m_skippedOnLoad;
            std::cerr << "[JsonHistoryRepository] Skipping decision: " << e.what() << std::endl;
        }
    }

    for (const auto& item : root.value("adaptations", json::array())) {
        try {
            m_adaptations.push_back(item.get<domain::AdaptationRecord>());
        } catch (const json::exception& e) {
            ++m_skippedOnLoad;
            std::cerr << "[JsonHistoryRepository] Skipping malformed adaptation: " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            ++m_skippedOnLoad;
            std::cerr << "[JsonHistoryRepository] Skipping adaptation: " << e.what() << std::endl;
        }
    }

    if (root.contains("profile")) {
        try {
            m_profile = root["profile"].get<domain::UserProfile>();
        } catch (const std::exception& e) {
            std::cerr << "[JsonHistoryRepository] Profile unreadable, using defaults: " << e.what() << std::endl;
        }
    }

    // Keep the log time-ordered and bounded even if the file was edited by hand.
    std::stable_sort(m_history.begin(), m_history.end(),
                     [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
    TrimTo(m_history, m_historyLimit);

    std::cout << "[JsonHistoryRepository] Loaded " << m_history.size() << " decisions from "
              << m_storePath << std::endl;
}

void JsonHistoryRepository::persistLocked() {
    m_persistence->saveTextAsync(m_storePath, EncodeStore(m_history, m_adaptations, m_profile));
}

std::vector<domain::TradeOffDecision> JsonHistoryRepository::getHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

// Mutations encode the next state before committing it to memory.

void JsonHistoryRepository::appendDecision(const domain::TradeOffDecision& decision) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto next = m_history;
    next.push_back(decision);
    TrimTo(next, m_historyLimit);
    const std::string text = EncodeStore(next, m_adaptations, m_profile);

    m_history = std::move(next);
    m_persistence->saveTextAsync(m_storePath, text);
}

void JsonHistoryRepository::clearHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
    m_adaptations.clear();
    persistLocked();
}

std::vector<domain::AdaptationRecord> JsonHistoryRepository::getAdaptations() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_adaptations;
}

void JsonHistoryRepository::appendAdaptations(const std::vector<domain::AdaptationRecord>& records) {
    if (records.empty()) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto next = m_adaptations;
    next.insert(next.end(), records.begin(), records.end());
    const std::string text = EncodeStore(m_history, next, m_profile);

    m_adaptations = std::move(next);
    m_persistence->saveTextAsync(m_storePath, text);
}

domain::UserProfile JsonHistoryRepository::getProfile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profile;
}

void JsonHistoryRepository::saveProfile(const domain::UserProfile& profile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string text = EncodeStore(m_history, m_adaptations, profile);

    m_profile = profile;
    m_persistence->saveTextAsync(m_storePath, text);
}

} // namespace equilibra::infrastructure
