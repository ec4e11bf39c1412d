#include <cassert>
#include <iostream>
#include <memory>
#include "infrastructure/ProviderResolver.hpp"
#include "infrastructure/CredentialStores.hpp"
#include "infrastructure/OpenAIAdapter.hpp"

using namespace draftlens::infrastructure;

int main() {
    std::cout << "[Test] Starting ProviderResolver Test..." << std::endl;

    auto registry = std::make_shared<RateLimiterRegistry>();
    ProviderResolver resolver(registry);
    InMemoryCredentialStore credentials;

    // OpenAI without a key
    AppConfig config;
    auto missing = resolver.resolve(config, credentials);
    assert(missing.status == ResolutionStatus::CredentialMissing);
    assert(missing.providerId == "openai");
    assert(!missing.isReady());
    assert(!missing.adapter);
    std::cout << "[PASS] missing credential" << std::endl;

    // Blank key counts as missing
    credentials.set("openai", "   ");
    assert(resolver.resolve(config, credentials).status == ResolutionStatus::CredentialMissing);

    credentials.set("openai", "sk-test");
    auto ready = resolver.resolve(config, credentials);
    assert(ready.isReady());
    assert(ready.adapter->providerName() == "openai");
    assert(ready.adapter->modelName() == "gpt-4");
    std::cout << "[PASS] openai ready" << std::endl;

    // Insecure base URL is a configuration error, not a crash
    OpenAIProviderConfig insecure;
    insecure.baseUrl = "http://example.com";
    config.provider = insecure;
    auto rejected = resolver.resolve(config, credentials);
    assert(rejected.status == ResolutionStatus::ConfigurationError);
    assert(!rejected.message.empty());
    std::cout << "[PASS] insecure base url" << std::endl;

    // Claude
    ClaudeProviderConfig claude;
    claude.model = "claude-3-opus";
    config.provider = claude;
    assert(resolver.resolve(config, credentials).status == ResolutionStatus::CredentialMissing);
    credentials.set("claude", "sk-ant");
    auto claudeReady = resolver.resolve(config, credentials);
    assert(claudeReady.isReady());
    assert(claudeReady.providerId == "claude");
    assert(claudeReady.adapter->modelName() == "claude-3-opus-20240229");
    std::cout << "[PASS] claude ready" << std::endl;

    // Local needs no credential
    LocalProviderConfig local;
    config.provider = local;
    InMemoryCredentialStore empty;
    auto localReady = resolver.resolve(config, empty);
    assert(localReady.isReady());
    assert(localReady.adapter->providerName() == "local");
    assert(!ProviderResolver::CredentialKeyFor(config.provider));

    local.endpoint = "";
    config.provider = local;
    auto localBroken = resolver.resolve(config, empty);
    assert(localBroken.status == ResolutionStatus::ConfigurationError);
    assert(localBroken.message == "Local LLM endpoint is required when using local provider");
    std::cout << "[PASS] local provider" << std::endl;

    assert(ResolutionStatusToString(ResolutionStatus::CredentialMissing) == "credential-missing");

    std::cout << "[Test] ProviderResolver Test completed." << std::endl;
    return 0;
}
