/**
 * test_llm_gateway.cpp - Unit tests for LLMGateway, providers and Simulator
 */

#include "lh/LLMGateway.hpp"
#include "lh/PromptBuilder.hpp"
#include "lh/Simulator.hpp"

#include <cassert>
#include <iostream>

namespace {

lh::Config configFor(lh::Provider provider) {
    lh::Config config;
    config.provider = provider;
    return config;
}

} // anonymous namespace

void test_simulator_git_unstage() {
    lh::PromptBuilder builder;
    lh::Simulator simulator;

    auto without_docs = simulator.respond(
        builder.build("git", {"reset"}, "I want to unstage my changes", std::nullopt));
    auto with_docs = simulator.respond(
        builder.build("git", {"reset"}, "I want to unstage my changes", std::string("GIT-RESET(1)")));

    assert(*without_docs.recommended_command == "git reset HEAD");
    assert(*with_docs.recommended_command == "git reset HEAD");
    assert(without_docs.warnings.has_value());
    assert(*without_docs.additional_info != *with_docs.additional_info);
    assert(with_docs.additional_info->find("(Analysis based on git man page)") != std::string::npos);
    assert(without_docs.explanation == with_docs.explanation);

    std::cout << "[PASS] test_simulator_git_unstage\n";
}

void test_simulator_docker_running() {
    lh::Simulator simulator;

    auto response = simulator.respond("docker ps: show only running containers");

    assert(*response.recommended_command == "docker ps");
    assert(!response.warnings.has_value());
    assert(response.additional_info->find("docker ps -a") != std::string::npos);

    auto with_docs = simulator.respond("docker ps running\nMAN PAGE CONTENT:\n...");
    assert(with_docs.additional_info->find("(Analysis based on docker man page)") != std::string::npos);

    std::cout << "[PASS] test_simulator_docker_running\n";
}

void test_simulator_generic() {
    lh::Simulator simulator;

    auto response = simulator.respond("tar: extract an archive");

    assert(!response.recommended_command.has_value());
    assert(response.explanation == "This is a simulated LLM response for testing purposes.");
    assert(response.warnings->find("without man page context") != std::string::npos);

    auto with_docs = simulator.respond("tar\nMAN PAGE CONTENT:\nTAR(1)");
    assert(with_docs.warnings->find("with man page context") != std::string::npos);

    std::cout << "[PASS] test_simulator_generic\n";
}

void test_gateway_dispatches_simulation() {
    auto config = configFor(lh::Provider::SIMULATION);
    lh::LLMGateway gateway(config);

    auto response = gateway.respond("git reset unstage");

    assert(*response.recommended_command == "git reset HEAD");

    std::cout << "[PASS] test_gateway_dispatches_simulation\n";
}

void test_missing_key_is_canned_response() {
    auto openrouter = lh::LLMGateway(configFor(lh::Provider::OPENROUTER)).respond("prompt");
    assert(openrouter.explanation == "OpenRouter provider selected but no API key configured.");
    assert(!openrouter.recommended_command.has_value());
    assert(openrouter.warnings->find("LOCALHELP_API_KEY") != std::string::npos);

    auto openai = lh::LLMGateway(configFor(lh::Provider::OPENAI)).respond("prompt");
    assert(openai.explanation.find("OpenAI provider selected") == 0);

    auto anthropic = lh::LLMGateway(configFor(lh::Provider::ANTHROPIC)).respond("prompt");
    assert(anthropic.explanation.find("Anthropic provider selected") == 0);

    std::cout << "[PASS] test_missing_key_is_canned_response\n";
}

void test_local_needs_url() {
    auto config = configFor(lh::Provider::LOCAL);
    config.api_key = "unused";

    auto missing = lh::LLMGateway(config).respond("prompt");
    assert(missing.explanation == "Local LLM provider selected but no API URL configured.");
    assert(missing.warnings->find("LOCALHELP_API_URL") != std::string::npos);

    config.api_url = "http://localhost:11434";
    auto pending = lh::LLMGateway(config).respond("prompt");
    assert(pending.explanation == "Local LLM integration placeholder");
    assert(!pending.recommended_command.has_value());

    std::cout << "[PASS] test_local_needs_url\n";
}

void test_placeholders_with_key() {
    auto config = configFor(lh::Provider::OPENAI);
    config.api_key = "sk-test";
    auto openai = lh::LLMGateway(config).respond("prompt");
    assert(openai.explanation == "OpenAI integration placeholder");
    assert(*openai.warnings == "OpenAI API integration not yet implemented.");

    config.provider = lh::Provider::ANTHROPIC;
    auto anthropic = lh::LLMGateway(config).respond("prompt");
    assert(anthropic.explanation == "Anthropic integration placeholder");

    std::cout << "[PASS] test_placeholders_with_key\n";
}

void test_backend_variant_matches_provider() {
    assert(std::holds_alternative<lh::OpenRouterProvider>(lh::makeBackend(lh::Provider::OPENROUTER)));
    assert(std::holds_alternative<lh::OpenAIProvider>(lh::makeBackend(lh::Provider::OPENAI)));
    assert(std::holds_alternative<lh::AnthropicProvider>(lh::makeBackend(lh::Provider::ANTHROPIC)));
    assert(std::holds_alternative<lh::LocalProvider>(lh::makeBackend(lh::Provider::LOCAL)));
    assert(std::holds_alternative<lh::SimulationProvider>(lh::makeBackend(lh::Provider::SIMULATION)));

    std::cout << "[PASS] test_backend_variant_matches_provider\n";
}

int main() {
    std::cout << "Running LLMGateway tests...\n\n";

    test_simulator_git_unstage();
    test_simulator_docker_running();
    test_simulator_generic();
    test_gateway_dispatches_simulation();
    test_missing_key_is_canned_response();
    test_local_needs_url();
    test_placeholders_with_key();
    test_backend_variant_matches_provider();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
