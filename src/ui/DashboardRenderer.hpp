/**
 * @file DashboardRenderer.hpp
 * @brief Main entry point for the Dear ImGui dashboard rendering.
 */

#pragma once

#include "ui/DashboardState.hpp"

namespace equilibra::ui {

/**
 * @brief Main UI rendering entry point. Call once per frame.
 * @param app The shared dashboard state.
 */
void DrawDashboard(DashboardState& app);

} // namespace equilibra::ui
