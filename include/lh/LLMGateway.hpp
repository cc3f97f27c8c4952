/**
 * LLMGateway.hpp - Dispatch a prompt to the configured provider
 */

#pragma once

#include "lh/Config.hpp"
#include "lh/ResponseParser.hpp"

#include <string>
#include <variant>

namespace lh {

struct OpenRouterProvider {
    LLMResponse respond(const Config& config, const std::string& prompt) const;
};

// Placeholder: canned response, no network
struct OpenAIProvider {
    LLMResponse respond(const Config& config, const std::string& prompt) const;
};

// Placeholder: canned response, no network
struct AnthropicProvider {
    LLMResponse respond(const Config& config, const std::string& prompt) const;
};

// Placeholder: needs LOCALHELP_API_URL, no network
struct LocalProvider {
    LLMResponse respond(const Config& config, const std::string& prompt) const;
};

struct SimulationProvider {
    LLMResponse respond(const Config& config, const std::string& prompt) const;
};

using ProviderBackend = std::variant<OpenRouterProvider,
                                     OpenAIProvider,
                                     AnthropicProvider,
                                     LocalProvider,
                                     SimulationProvider>;

ProviderBackend makeBackend(Provider provider);

class LLMGateway {
public:
    explicit LLMGateway(const Config& config);

    // Transport and JSON failures propagate as lh::Error
    LLMResponse respond(const std::string& prompt) const;

private:
    const Config& config_;
    ProviderBackend backend_;
};

} // namespace lh
