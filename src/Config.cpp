/**
 * Config.cpp - Runtime configuration loaded once from the environment
 */

#include "lh/Config.hpp"
#include "lh/Console.hpp"
#include "lh/SecretStore.hpp"

#include <cstdlib>

namespace lh {

namespace {

std::optional<std::string> getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

std::optional<Provider> providerFromString(const std::string& name) {
    if (name == "openrouter") return Provider::OPENROUTER;
    if (name == "openai") return Provider::OPENAI;
    if (name == "anthropic") return Provider::ANTHROPIC;
    if (name == "local") return Provider::LOCAL;
    if (name == "simulation") return Provider::SIMULATION;
    return std::nullopt;
}

std::string providerName(Provider provider) {
    switch (provider) {
        case Provider::OPENROUTER: return "openrouter";
        case Provider::OPENAI:     return "openai";
        case Provider::ANTHROPIC:  return "anthropic";
        case Provider::LOCAL:      return "local";
        case Provider::SIMULATION: return "simulation";
    }
    return "openrouter";
}

Config Config::fromEnvironment(SecretStore& secrets, CommandRunner& runner) {
    Config config;

    auto debug_env = getEnv("LOCALHELP_DEV");
    config.debug_mode = debug_env && (*debug_env == "true" || *debug_env == "1");

    if (auto provider_env = getEnv("LOCALHELP_LLM_PROVIDER")) {
        config.provider = providerFromString(*provider_env).value_or(Provider::OPENROUTER);
    }

    config.api_key = getEnv("LOCALHELP_API_KEY");
    config.api_url = getEnv("LOCALHELP_API_URL");
    config.model_name = getEnv("LOCALHELP_MODEL");

    if (!config.api_key) {
        std::string service = secretServiceName(providerName(config.provider));
        auto account = currentUser(runner);
        if (!account) {
            LH_DEBUG(config, "Could not determine current user, skipping secret store");
        } else {
            SecretLookup lookup = secrets.get(service, *account);
            if (lookup.found()) {
                config.api_key = lookup.value;
                LH_DEBUG(config, "API key loaded from secret store (" << service << ")");
            } else {
                LH_DEBUG(config, "Secret store lookup for " << service << " failed: "
                                 << secretStatusName(lookup.status)
                                 << (lookup.error.empty() ? "" : " - " + lookup.error));
            }
        }
    }

    LH_DEBUG(config, "Provider: " << providerName(config.provider)
                     << ", api key: " << (config.api_key ? "set" : "unset")
                     << ", api url: " << config.api_url.value_or("unset")
                     << ", model: " << config.model_name.value_or("default"));

    return config;
}

} // namespace lh
