/**
 * Assistant.cpp - The per-invocation pipeline: docs, prompt, LLM, confirmation
 */

#include "lh/Assistant.hpp"
#include "lh/CommandParser.hpp"
#include "lh/Config.hpp"
#include "lh/Console.hpp"
#include "lh/DocResolver.hpp"
#include "lh/ExecutionGate.hpp"
#include "lh/LLMGateway.hpp"
#include "lh/PromptBuilder.hpp"

#include <istream>
#include <ostream>

namespace lh {

using namespace console;

void printUsage(std::ostream& out) {
    out << BOLD << "localhelp" << RESET << " - man pages and --help, explained by an LLM\n\n"
        << "Usage: localhelp <command> [subcommand] [args...] ['query']\n"
        << "Example: localhelp git reset 'I want to unstage changes but keep them'\n"
        << "Example: localhelp docker ps 'show only running containers'\n";
}

Assistant::Assistant(const Config& config, CommandRunner& runner,
                     std::istream& in, std::ostream& out)
    : config_(config), runner_(runner), in_(in), out_(out) {}

void Assistant::process(const std::vector<std::string>& args) {
    CommandParser parser;
    CommandInfo info = parser.split(args);

    LH_DEBUG(config_, "Attempting to fetch documentation for command: " << info.command);
    DocResolver resolver(runner_, config_);
    auto documentation = resolver.resolve(info.command, info.args);

    if (!documentation) {
        LH_DEBUG(config_, "No man page or help content found for command: " << info.command);
        if (info.query) {
            out_ << "ℹ️  No man page or help content found for '" << info.command
                 << "', querying LLM without documentation\n";
            processWithLLM(info, std::nullopt, *info.query);
        } else {
            out_ << RED << "❌ No documentation found for '" << info.command
                 << "' and no query provided." << RESET << "\n"
                 << "Usage: localhelp " << info.command << " 'your question here'\n";
        }
        return;
    }

    if (info.query) {
        processWithLLM(info, documentation, *info.query);
    } else {
        printDocumentation(info.command, *documentation);
    }
}

void Assistant::printDocumentation(const std::string& command, const std::string& documentation) {
    out_ << BOLD << "📖 Documentation for " << command << ":" << RESET << "\n"
         << RULE << "\n"
         << documentation << "\n";
}

void Assistant::processWithLLM(const CommandInfo& info,
                               const std::optional<std::string>& documentation,
                               const std::string& query) {
    PromptBuilder builder;
    std::string prompt = builder.build(info.command, info.args, query, documentation);

    LH_DEBUG(config_, "Sending LLM request with provider: " << providerName(config_.provider));
    LH_DEBUG(config_, "LLM prompt preview: " << preview(prompt, 500) << "...");

    LLMGateway gateway(config_);
    LLMResponse response = gateway.respond(prompt);

    ExecutionGate gate(runner_, in_, out_);
    gate.present(response);
}

} // namespace lh
