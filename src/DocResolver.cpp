/**
 * DocResolver.cpp - Find documentation for a command (man page or help output)
 */

#include "lh/DocResolver.hpp"
#include "lh/Config.hpp"
#include "lh/Console.hpp"
#include "lh/Subprocess.hpp"

namespace lh {

namespace {

const std::vector<std::string> HELP_MARKERS = {
    "Usage:", "usage:", "USAGE:",
    "Options:", "options:",
    "Commands:", "commands:",
    "--help",
    "Examples:",
    "Description:"
};

const size_t MIN_HELP_LENGTH = 10;

} // anonymous namespace

DocResolver::DocResolver(CommandRunner& runner, const Config& config)
    : runner_(runner), config_(config) {}

std::optional<std::string> DocResolver::resolve(const std::string& command,
                                                const std::vector<std::string>& args) {
    LH_DEBUG(config_, "Trying to get man page for: " << command);
    if (auto man = tryManPage(command)) {
        LH_DEBUG(config_, "Man page found, length: " << man->size() << " chars");
        LH_DEBUG(config_, "Man page preview: " << console::preview(*man, 200) << "...");
        return man;
    }

    LH_DEBUG(config_, "Man page not found, trying help content");
    if (auto help = tryHelpContent(command, args)) {
        LH_DEBUG(config_, "Help content found, length: " << help->size() << " chars");
        LH_DEBUG(config_, "Help content preview: " << console::preview(*help, 200) << "...");
        return help;
    }

    LH_DEBUG(config_, "No help content found either");
    return std::nullopt;
}

std::optional<std::string> DocResolver::tryManPage(const std::string& command) {
    // Equivalent of `man <command> | col -bx` with pipefail: both stages must exit 0
    LH_DEBUG(config_, "Executing man command: man " << command << " | col -bx");
    auto man = runner_.run({"man", command});
    if (!man.exitedWith(0)) {
        LH_DEBUG(config_, "Man command failed with exit code: " << man.exit_code
                          << (man.error.empty() ? "" : ", error: " + man.error)
                          << ", stderr: " << man.stderr_text);
        return std::nullopt;
    }

    // col strips the backspace overstrike used for bold and underline
    auto filtered = runner_.run({"col", "-bx"}, man.stdout_text);
    if (!filtered.exitedWith(0)) {
        LH_DEBUG(config_, "col failed with exit code: " << filtered.exit_code
                          << (filtered.error.empty() ? "" : ", error: " + filtered.error));
        return std::nullopt;
    }

    return filtered.stdout_text;
}

std::vector<std::vector<std::string>> DocResolver::helpPatterns(
    const std::string& command, const std::vector<std::string>& args) {
    std::vector<std::vector<std::string>> patterns = {
        {command, "--help"},
        {command, "-h"},
    };

    // Subcommand help, e.g. `git reset --help`
    if (!args.empty()) {
        patterns.push_back({command, args[0], "--help"});
        patterns.push_back({command, args[0], "-h"});
    } else {
        patterns.push_back({command, "--help"});
        patterns.push_back({command, "-h"});
    }

    patterns.push_back({command, "help"});
    // Some tools print usage when run bare
    patterns.push_back({command});

    return patterns;
}

bool DocResolver::looksLikeHelp(const std::string& output) {
    if (output.size() < MIN_HELP_LENGTH) {
        return false;
    }
    for (const auto& marker : HELP_MARKERS) {
        if (output.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> DocResolver::tryHelpContent(const std::string& command,
                                                       const std::vector<std::string>& args) {
    for (const auto& pattern : helpPatterns(command, args)) {
        LH_DEBUG(config_, "Trying help pattern: " << formatArgv(pattern));
        if (auto content = tryHelpCommand(pattern)) {
            return content;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DocResolver::tryHelpCommand(const std::vector<std::string>& argv) {
    auto result = runner_.run(argv);

    // Help output often comes with exit status 1 or 2
    bool valid_status = result.exitedWith(0) || result.exitedWith(1) || result.exitedWith(2);
    if (!valid_status) {
        LH_DEBUG(config_, "Help command failed with exit code: " << result.exit_code
                          << (result.error.empty() ? "" : ", error: " + result.error)
                          << ", stderr: " << console::preview(result.stderr_text, 200));
        return std::nullopt;
    }

    if (!looksLikeHelp(result.stdout_text)) {
        LH_DEBUG(config_, "Output doesn't look like help content, length: "
                          << result.stdout_text.size());
        return std::nullopt;
    }

    LH_DEBUG(config_, "Successfully got help content, length: " << result.stdout_text.size());
    return result.stdout_text;
}

} // namespace lh
