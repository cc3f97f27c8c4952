/**
 * LLMGateway.cpp - Dispatch a prompt to the configured provider
 */

#include "lh/LLMGateway.hpp"
#include "lh/Console.hpp"
#include "lh/OpenRouterClient.hpp"
#include "lh/Simulator.hpp"

namespace lh {

namespace {

LLMResponse cannedResponse(const std::string& explanation,
                           const std::string& warnings,
                           const std::string& info) {
    LLMResponse response;
    response.explanation = explanation;
    response.warnings = warnings;
    response.additional_info = info;
    return response;
}

LLMResponse pendingIntegration(const std::string& name) {
    return cannedResponse(name + " integration placeholder",
                          name + " API integration not yet implemented.",
                          "Coming soon! For now, use simulation mode.");
}

} // anonymous namespace

LLMResponse OpenRouterProvider::respond(const Config& config, const std::string& prompt) const {
    if (!config.api_key) {
        return cannedResponse(
            "OpenRouter provider selected but no API key configured.",
            "Set LOCALHELP_API_KEY environment variable with your OpenRouter API key.",
            "Get your key at https://openrouter.ai/keys. Example: export LOCALHELP_API_KEY=sk-or-...");
    }

    OpenRouterClient client(config);
    std::string text = client.complete(prompt);

    LH_DEBUG(config, "OpenRouter response received, length: " << text.size());
    LH_DEBUG(config, "OpenRouter raw response preview: " << console::preview(text, 200) << "...");

    return ResponseParser::parse(text);
}

LLMResponse OpenAIProvider::respond(const Config& config, const std::string&) const {
    if (!config.api_key) {
        return cannedResponse(
            "OpenAI provider selected but no API key configured.",
            "Set LOCALHELP_API_KEY environment variable with your OpenAI API key.",
            "Example: export LOCALHELP_API_KEY=sk-...");
    }
    return pendingIntegration("OpenAI");
}

LLMResponse AnthropicProvider::respond(const Config& config, const std::string&) const {
    if (!config.api_key) {
        return cannedResponse(
            "Anthropic provider selected but no API key configured.",
            "Set LOCALHELP_API_KEY environment variable with your Anthropic API key.",
            "Example: export LOCALHELP_API_KEY=sk-ant-...");
    }
    return pendingIntegration("Anthropic");
}

LLMResponse LocalProvider::respond(const Config& config, const std::string&) const {
    if (!config.api_url) {
        return cannedResponse(
            "Local LLM provider selected but no API URL configured.",
            "Set LOCALHELP_API_URL environment variable with your local LLM endpoint.",
            "Example: export LOCALHELP_API_URL=http://localhost:11434");
    }
    return pendingIntegration("Local LLM");
}

LLMResponse SimulationProvider::respond(const Config&, const std::string& prompt) const {
    return Simulator().respond(prompt);
}

ProviderBackend makeBackend(Provider provider) {
    switch (provider) {
        case Provider::OPENROUTER: return OpenRouterProvider{};
        case Provider::OPENAI:     return OpenAIProvider{};
        case Provider::ANTHROPIC:  return AnthropicProvider{};
        case Provider::LOCAL:      return LocalProvider{};
        case Provider::SIMULATION: return SimulationProvider{};
    }
    return OpenRouterProvider{};
}

LLMGateway::LLMGateway(const Config& config)
    : config_(config), backend_(makeBackend(config.provider)) {}

LLMResponse LLMGateway::respond(const std::string& prompt) const {
    LH_DEBUG(config_, "Getting LLM response using provider: " << providerName(config_.provider));

    LLMResponse response = std::visit(
        [&](const auto& backend) { return backend.respond(config_, prompt); },
        backend_);

    LH_DEBUG(config_, "LLM response received successfully");
    LH_DEBUG(config_, "LLM response explanation preview: "
                      << console::preview(response.explanation, 300) << "...");
    if (response.recommended_command) {
        LH_DEBUG(config_, "LLM recommended command: " << *response.recommended_command);
    }

    return response;
}

} // namespace lh
