/**
 * @file HistoryRepository.hpp
 * @brief Interface for persistence of decision history, adaptations and the user profile.
 */

#pragma once

#include <vector>
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"
#include "domain/UserProfile.hpp"

namespace equilibra::domain {

/**
 * @class HistoryRepository
 * @brief Abstract store injected into the application services.
 *
 * History is append-only, time-ordered and bounded to the most recent
 * entries; implementations trim after each append.
 */
class HistoryRepository {
public:
    virtual ~HistoryRepository() = default;

    /** @brief Returns a snapshot copy of the stored history, oldest first. */
    virtual std::vector<TradeOffDecision> getHistory() = 0;

    /** @brief Appends a decision and trims to the configured limit. */
    virtual void appendDecision(const TradeOffDecision& decision) = 0;

    virtual void clearHistory() = 0;

    virtual std::vector<AdaptationRecord> getAdaptations() = 0;
    virtual void appendAdaptations(const std::vector<AdaptationRecord>& records) = 0;

    virtual UserProfile getProfile() = 0;
    virtual void saveProfile(const UserProfile& profile) = 0;
};

} // namespace equilibra::domain
