/**
 * @file JsonCodec.hpp
 * @brief nlohmann::json mappings for every persisted engine record.
 *
 * The functions live in the domain namespace so nlohmann finds them by
 * argument-dependent lookup. Timestamps are milliseconds since the Unix
 * epoch; optional values encode as null. Decoding throws
 * nlohmann::json::exception for malformed documents and
 * std::invalid_argument for unknown enum names.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Council.hpp"
#include "domain/Decision.hpp"
#include "domain/Forecast.hpp"
#include "domain/NarrativeService.hpp"
#include "domain/UserProfile.hpp"

namespace equilibra::infrastructure {

using json = nlohmann::json;

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point t);
std::chrono::system_clock::time_point FromEpochMillis(std::int64_t ms);

/**
 * @brief Serializes for storage or transport. Invalid UTF-8 in user-entered
 * text (task names, activities, goals) becomes U+FFFD instead of throwing.
 * @param indent -1 for compact output.
 */
std::string DumpJson(const json& j, int indent = -1);

json WeightsToJson(const domain::CategoryWeights& weights);
domain::CategoryWeights WeightsFromJson(const json& j);

} // namespace equilibra::infrastructure

namespace equilibra::domain {

void to_json(nlohmann::json& j, const StateSnapshot& s);
void from_json(const nlohmann::json& j, StateSnapshot& s);

void to_json(nlohmann::json& j, const Constraint& c);
void from_json(const nlohmann::json& j, Constraint& c);

void to_json(nlohmann::json& j, const PlannedTask& t);
void from_json(const nlohmann::json& j, PlannedTask& t);

void to_json(nlohmann::json& j, const DomainDecision& d);
void from_json(const nlohmann::json& j, DomainDecision& d);

void to_json(nlohmann::json& j, const FutureImpact& f);
void from_json(const nlohmann::json& j, FutureImpact& f);

void to_json(nlohmann::json& j, const PriorityAdjustment& p);
void from_json(const nlohmann::json& j, PriorityAdjustment& p);

void to_json(nlohmann::json& j, const TradeOffDecision& d);
void from_json(const nlohmann::json& j, TradeOffDecision& d);

void to_json(nlohmann::json& j, const AgentRecommendation& r);
void from_json(const nlohmann::json& j, AgentRecommendation& r);

void to_json(nlohmann::json& j, const ConsensusDecision& c);
void from_json(const nlohmann::json& j, ConsensusDecision& c);

void to_json(nlohmann::json& j, const BurnoutForecast& f);
void from_json(const nlohmann::json& j, BurnoutForecast& f);

void to_json(nlohmann::json& j, const AdaptationRecord& a);
void from_json(const nlohmann::json& j, AdaptationRecord& a);

void to_json(nlohmann::json& j, const ConstraintThresholds& t);
void from_json(const nlohmann::json& j, ConstraintThresholds& t);

void to_json(nlohmann::json& j, const UserProfile& p);
void from_json(const nlohmann::json& j, UserProfile& p);

void to_json(nlohmann::json& j, const DecisionNarrative& n);
void from_json(const nlohmann::json& j, DecisionNarrative& n);

/** @brief Encode-only; the weekly report is a derived view. */
void to_json(nlohmann::json& j, const WeeklyAdjustmentReport& r);

} // namespace equilibra::domain
