/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access upstream, server, cache and editor timing
 * settings without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace redline::infrastructure {

/**
 * @struct RedlineConfig
 * @brief Every tunable of the server and editor, with its default.
 */
struct RedlineConfig {
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string model = "llama3";

    std::string serverHost = "0.0.0.0";
    int serverPort = 8080;

    std::chrono::seconds cacheTtl{15 * 60};
    std::size_t cacheSweepThreshold = 500;
    std::size_t rateLimit = 120;
    std::chrono::seconds rateWindow{60 * 60};

    std::chrono::milliseconds historyDebounce{1000};
    std::chrono::milliseconds analysisDebounce{2000};
    std::size_t historyDepth = 200;
};

class ConfigLoader {
public:
    /**
     * @brief Finds settings.json: first in workingDir, then under the XDG config home.
     * @return std::nullopt if neither exists.
     */
    static std::optional<std::filesystem::path> FindSettingsFile(const std::filesystem::path& workingDir);

    /** @brief Loads the first settings.json found; defaults if there is none. */
    static RedlineConfig Load(const std::filesystem::path& workingDir = std::filesystem::current_path());

    /** @brief Reads one file. Unreadable or malformed files are logged and yield defaults. */
    static RedlineConfig LoadFromFile(const std::filesystem::path& path);

    /** @brief Overlays the keys present in j on the defaults; mistyped keys are skipped. */
    static RedlineConfig FromJson(const nlohmann::json& j);
};

} // namespace redline::infrastructure
