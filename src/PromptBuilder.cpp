/**
 * PromptBuilder.cpp - Build the structured LLM prompt
 */

#include "lh/PromptBuilder.hpp"

#include <sstream>

namespace lh {

const std::string DOC_HEADER = "MAN PAGE CONTENT:";
const std::string TRUNCATED_MARKER = "(truncated)";

std::string PromptBuilder::joinCommand(const std::string& command,
                                       const std::vector<std::string>& args) {
    std::string full = command;
    for (const auto& arg : args) {
        full += " " + arg;
    }
    return full;
}

std::string PromptBuilder::limitDocumentation(const std::string& documentation) {
    if (documentation.size() <= MAX_DOC_CHARS) {
        return documentation;
    }
    // Never split a multi-byte UTF-8 sequence
    size_t cut = MAX_DOC_CHARS;
    while (cut > 0 && (static_cast<unsigned char>(documentation[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return documentation.substr(0, cut) + "\n... " + TRUNCATED_MARKER;
}

std::string PromptBuilder::build(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const std::string& query,
                                 const std::optional<std::string>& documentation) const {
    std::ostringstream prompt;

    prompt << "You are a command line expert. Help the user with this command context.\n\n"
           << "COMMAND CONTEXT: " << joinCommand(command, args) << "\n"
           << "USER QUERY: " << query;

    if (documentation) {
        prompt << "\n\n" << DOC_HEADER << "\n" << limitDocumentation(*documentation);
    }

    prompt << "\n\nPlease respond with structured output in this exact format:\n\n"
           << "EXPLANATION: [Brief explanation of what the user wants to achieve]\n"
           << "COMMAND: [Exact command to run, or NONE if no specific command recommended]\n"
           << "WARNINGS: [Any important warnings or caveats, or NONE]\n"
           << "INFO: [Additional helpful information, or NONE]\n";

    return prompt.str();
}

} // namespace lh
