#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

using redline::infrastructure::ConfigLoader;
using redline::infrastructure::RedlineConfig;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

void TestDefaults() {
    std::cout << "[Test] Defaults match the documented values..." << std::endl;
    RedlineConfig config = ConfigLoader::FromJson(nlohmann::json::object());
    assert(config.ollamaHost == "localhost");
    assert(config.ollamaPort == 11434);
    assert(config.cacheTtl == 15min);
    assert(config.cacheSweepThreshold == 500);
    assert(config.rateLimit == 120);
    assert(config.rateWindow == 1h);
    assert(config.historyDebounce == 1000ms);
    assert(config.analysisDebounce == 2000ms);
    std::cout << "[PASS]" << std::endl;
}

void TestOverrides() {
    std::cout << "[Test] Present keys override, mistyped keys are skipped..." << std::endl;
    auto j = nlohmann::json::parse(R"({
        "model": "mistral",
        "server_port": 9090,
        "cache_ttl_seconds": 60,
        "rate_limit": "lots",
        "history_debounce_ms": 250
    })");
    RedlineConfig config = ConfigLoader::FromJson(j);
    assert(config.model == "mistral");
    assert(config.serverPort == 9090);
    assert(config.cacheTtl == 60s);
    assert(config.rateLimit == 120);
    assert(config.historyDebounce == 250ms);

    RedlineConfig notObject = ConfigLoader::FromJson(nlohmann::json::array());
    assert(notObject.model == RedlineConfig{}.model);
    std::cout << "[PASS]" << std::endl;
}

void TestFileLookup() {
    std::cout << "[Test] settings.json in the working directory wins..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "redline_config_test";
    fs::create_directories(dir);
    {
        std::ofstream f(dir / "settings.json");
        f << R"({"ollama_port": 12345})";
    }
    auto found = ConfigLoader::FindSettingsFile(dir);
    assert(found && *found == dir / "settings.json");
    assert(ConfigLoader::Load(dir).ollamaPort == 12345);

    {
        std::ofstream f(dir / "settings.json");
        f << "{ broken";
    }
    assert(ConfigLoader::LoadFromFile(dir / "settings.json").ollamaPort == 11434);
    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader tests..." << std::endl;
    TestDefaults();
    TestOverrides();
    TestFileLookup();
    std::cout << "[Test] All ConfigLoader tests passed." << std::endl;
    return 0;
}
