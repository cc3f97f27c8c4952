/**
 * Simulator.cpp - Offline canned responses keyed on prompt keywords
 */

#include "lh/Simulator.hpp"
#include "lh/PromptBuilder.hpp"

#include <initializer_list>

namespace lh {

namespace {

bool containsAll(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* word : words) {
        if (text.find(word) == std::string::npos) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool Simulator::hasDocumentation(const std::string& prompt) {
    return prompt.find(DOC_HEADER) != std::string::npos;
}

LLMResponse Simulator::respond(const std::string& prompt) const {
    bool has_docs = hasDocumentation(prompt);
    LLMResponse response;

    if (containsAll(prompt, {"git", "reset", "unstage"})) {
        response.explanation =
            "You want to unstage changes that are currently in the git index (staging area) "
            "but keep them as modified files in your working directory.";
        response.recommended_command = "git reset HEAD";
        response.warnings =
            "This will unstage ALL staged changes. To unstage specific files, "
            "use 'git reset HEAD <filename>'.";
        std::string info =
            "After running this command, your changes will still be present in your working "
            "directory but will no longer be staged for commit. You can re-stage them later "
            "with 'git add'.";
        response.additional_info = has_docs ? info + " (Analysis based on git man page)" : info;
        return response;
    }

    if (containsAll(prompt, {"docker", "ps", "running"})) {
        response.explanation =
            "You want to see only currently running Docker containers, not stopped ones.";
        response.recommended_command = "docker ps";
        std::string info =
            "By default, 'docker ps' only shows running containers. To see all containers "
            "including stopped ones, use 'docker ps -a'.";
        response.additional_info = has_docs ? info + " (Analysis based on docker man page)" : info;
        return response;
    }

    response.explanation = "This is a simulated LLM response for testing purposes.";
    response.warnings = has_docs
        ? "This is a simulated response with man page context. For real AI assistance, configure an API key."
        : "This is a simulated response without man page context. For real AI assistance, configure an API key.";
    response.additional_info =
        "Set LOCALHELP_LLM_PROVIDER and LOCALHELP_API_KEY environment variables.";
    return response;
}

} // namespace lh
