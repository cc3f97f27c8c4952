/**
 * DocResolver.hpp - Find documentation for a command (man page or help output)
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lh {

class CommandRunner;
struct Config;

class DocResolver {
public:
    DocResolver(CommandRunner& runner, const Config& config);

    // Man page first, then the help-flag patterns in order. nullopt means no
    // strategy produced documentation (ManPageNotFound).
    std::optional<std::string> resolve(const std::string& command,
                                       const std::vector<std::string>& args);

    std::optional<std::string> tryManPage(const std::string& command);
    std::optional<std::string> tryHelpContent(const std::string& command,
                                              const std::vector<std::string>& args);

    // The argv patterns tried after the man page, in order
    static std::vector<std::vector<std::string>> helpPatterns(
        const std::string& command, const std::vector<std::string>& args);

    static bool looksLikeHelp(const std::string& output);

private:
    CommandRunner& runner_;
    const Config& config_;

    std::optional<std::string> tryHelpCommand(const std::vector<std::string>& argv);
};

} // namespace lh
