/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include "infrastructure/PathUtils.hpp"

namespace redline::infrastructure {

namespace fs = std::filesystem;

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

template <typename Duration>
void ReadDuration(const nlohmann::json& j, const char* key, Duration& target) {
    long long count = target.count();
    ReadKey(j, key, count);
    if (count < 0) {
        std::cerr << "[ConfigLoader] Ignoring negative '" << key << "'" << std::endl;
        return;
    }
    target = Duration(count);
}

} // namespace

std::optional<fs::path> ConfigLoader::FindSettingsFile(const fs::path& workingDir) {
    std::error_code ec;
    fs::path local = workingDir / "settings.json";
    if (fs::exists(local, ec)) {
        return local;
    }
    fs::path user = PathUtils::GetSettingsFile();
    if (fs::exists(user, ec)) {
        return user;
    }
    return std::nullopt;
}

RedlineConfig ConfigLoader::Load(const fs::path& workingDir) {
    auto path = FindSettingsFile(workingDir);
    if (!path) {
        std::cout << "[ConfigLoader] No settings.json found, using defaults" << std::endl;
        return RedlineConfig{};
    }
    return LoadFromFile(*path);
}

RedlineConfig ConfigLoader::LoadFromFile(const fs::path& path) {
    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << std::endl;
            return RedlineConfig{};
        }
        nlohmann::json j;
        f >> j;
        std::cout << "[ConfigLoader] Loaded " << path << std::endl;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return RedlineConfig{};
}

RedlineConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    RedlineConfig config;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return config;
    }

    ReadKey(j, "ollama_host", config.ollamaHost);
    ReadKey(j, "ollama_port", config.ollamaPort);
    ReadKey(j, "model", config.model);
    ReadKey(j, "server_host", config.serverHost);
    ReadKey(j, "server_port", config.serverPort);
    ReadDuration(j, "cache_ttl_seconds", config.cacheTtl);
    ReadKey(j, "cache_sweep_threshold", config.cacheSweepThreshold);
    ReadKey(j, "rate_limit", config.rateLimit);
    ReadDuration(j, "rate_window_seconds", config.rateWindow);
    ReadDuration(j, "history_debounce_ms", config.historyDebounce);
    ReadDuration(j, "analysis_debounce_ms", config.analysisDebounce);
    ReadKey(j, "history_depth", config.historyDepth);
    return config;
}

} // namespace redline::infrastructure
