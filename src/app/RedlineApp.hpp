/**
 * @file RedlineApp.hpp
 * @brief Main application class of the Redline editor.
 */

#pragma once

#include <string>
#include "ui/AppState.hpp"

struct SDL_Window;

namespace redline::app {

/**
 * @class RedlineApp
 * @brief Orchestrates the editor lifecycle, including initialization, the main loop, and shutdown.
 */
class RedlineApp {
public:
    /** @param documentPath Optional text file loaded into the editor at startup. */
    explicit RedlineApp(std::string documentPath = {});

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Initializes SDL, OpenGL, ImGui and the editing session.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    std::string m_documentPath;
    ui::AppState m_state; ///< Editing session and analysis worker.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false;
    bool m_imguiInitialized = false;
};

} // namespace redline::app
