/**
 * @file EquilibraApp.hpp
 * @brief Main application class for the Equilibra dashboard.
 */

#pragma once

#include <string>
#include "ui/DashboardState.hpp"

struct SDL_Window;

namespace equilibra::app {

/**
 * @class EquilibraApp
 * @brief Orchestrates the application lifecycle, including initialization, the main loop, and shutdown.
 */
class EquilibraApp {
public:
    explicit EquilibraApp(std::string projectRoot);

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Initializes SDL, OpenGL, ImGui and the dashboard state.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    std::string m_projectRoot;
    ui::DashboardState m_state;
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false;
    bool m_imguiInitialized = false;
};

} // namespace equilibra::app
