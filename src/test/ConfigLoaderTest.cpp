#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <variant>
#include "infrastructure/ConfigLoader.hpp"

using namespace draftlens::infrastructure;
using json = nlohmann::json;
namespace fs = std::filesystem;

static bool Contains(const std::vector<std::string>& items, const std::string& needle) {
    for (const auto& item : items) {
        if (item == needle) return true;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    // Full document
    json settings = json::parse(R"({
        "provider": "local",
        "local": {"endpoint": "http://localhost:9000", "model": "qwen"},
        "openai": {"model": "gpt-4-turbo", "baseUrl": " https://proxy.example.com "},
        "performance": {"enableCache": false, "cacheTTL": 1000, "cacheMaxSize": 2048},
        "rateLimit": {"maxTokens": 5, "refillRate": 0.5, "maxWaitMs": 100},
        "retry": {"maxAttempts": 4, "backoffBaseMs": 10, "timeoutSeconds": 5},
        "apply": {"settleDelayMs": 0}
    })");
    std::vector<std::string> errors;
    AppConfig config = ConfigLoader::Parse(settings, errors);
    assert(errors.empty());
    const auto* local = std::get_if<LocalProviderConfig>(&config.provider);
    assert(local);
    assert(local->endpoint == "http://localhost:9000");
    assert(local->model == "qwen");
    assert(!config.cache.enabled);
    assert(config.cache.ttlMs == 1000);
    assert(config.cache.maxBytes == 2048);
    assert(config.rateLimit.maxTokens == 5);
    assert(config.rateLimit.refillRate == 0.5);
    assert(config.retry.maxAttempts == 4);
    assert(config.apply.settleDelayMs == 0);
    assert(ConfigLoader::Validate(config).empty());
    std::cout << "[PASS] parse full settings" << std::endl;

    // Invalid provider and mistyped values keep defaults
    errors.clear();
    AppConfig fallback = ConfigLoader::Parse(json::parse(R"({
        "provider": "gemini",
        "retry": {"maxAttempts": "three"},
        "performance": {"enableCache": "yes"}
    })"), errors);
    assert(Contains(errors, "Invalid AI provider: gemini"));
    assert(Contains(errors, "retry.maxAttempts must be a number"));
    assert(Contains(errors, "performance.enableCache must be a boolean"));
    assert(ProviderId(fallback.provider) == "openai");
    assert(fallback.retry.maxAttempts == 3);
    assert(fallback.cache.enabled);
    std::cout << "[PASS] invalid values are reported" << std::endl;

    // Validation
    AppConfig bad;
    LocalProviderConfig blank;
    blank.endpoint = " ";
    blank.model = "";
    bad.provider = blank;
    bad.rateLimit.refillRate = 0;
    bad.retry.maxAttempts = 0;
    auto problems = ConfigLoader::Validate(bad);
    assert(Contains(problems, "Local LLM endpoint is required when using local provider"));
    assert(Contains(problems, "Local LLM model name is required when using local provider"));
    assert(Contains(problems, "rateLimit.refillRate must be greater than 0"));
    assert(Contains(problems, "retry.maxAttempts must be at least 1"));
    std::cout << "[PASS] validate" << std::endl;

    // Load from disk
    fs::path dir = fs::temp_directory_path() / "draftlens_config_test";
    fs::create_directories(dir);
    fs::path file = dir / "settings.json";

    AppConfig missing = ConfigLoader::Load((dir / "absent.json").string());
    assert(ProviderId(missing.provider) == "openai");

    {
        std::ofstream out(file);
        out << ConfigLoader::ToJson(config).dump(2);
    }
    AppConfig loaded = ConfigLoader::Load(file.string());
    assert(ProviderId(loaded.provider) == "local");
    assert(std::get<LocalProviderConfig>(loaded.provider).model == "qwen");
    assert(loaded.retry.backoffBaseMs == 10);
    assert(!loaded.cache.enabled);

    {
        std::ofstream out(file);
        out << "{ not json";
    }
    AppConfig garbage = ConfigLoader::Load(file.string());
    assert(ProviderId(garbage.provider) == "openai");
    assert(garbage.retry.maxAttempts == 3);
    std::cout << "[PASS] load from disk" << std::endl;

    setenv("XDG_CONFIG_HOME", dir.string().c_str(), 1);
    assert(ConfigLoader::DefaultSettingsPath() == (dir / "draftlens" / "settings.json").string());
    unsetenv("XDG_CONFIG_HOME");
    std::cout << "[PASS] default settings path" << std::endl;

    fs::remove_all(dir);
    std::cout << "[Test] ConfigLoader Test completed." << std::endl;
    return 0;
}
