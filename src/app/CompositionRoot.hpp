/**
 * @file CompositionRoot.hpp
 * @brief Builds the application services from settings.json.
 */

#pragma once

#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace equilibra::app {

/**
 * @brief Wires repository, log store, narrative strategy and application
 * services for a project root.
 *
 * Thresholds and preferences from the config overwrite the stored profile;
 * the profile keeps the user's identity and goal.
 */
application::AppServices BuildServices(const std::string& projectRoot, const infrastructure::AppConfig& config);

} // namespace equilibra::app
