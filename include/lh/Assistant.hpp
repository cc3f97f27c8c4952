/**
 * Assistant.hpp - The per-invocation pipeline: docs, prompt, LLM, confirmation
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lh {

class CommandRunner;
struct CommandInfo;
struct Config;

class Assistant {
public:
    Assistant(const Config& config, CommandRunner& runner,
              std::istream& in, std::ostream& out);

    // args excludes the program name. Fatal failures throw lh::Error.
    void process(const std::vector<std::string>& args);

private:
    const Config& config_;
    CommandRunner& runner_;
    std::istream& in_;
    std::ostream& out_;

    void processWithLLM(const CommandInfo& info,
                        const std::optional<std::string>& documentation,
                        const std::string& query);
    void printDocumentation(const std::string& command, const std::string& documentation);
};

void printUsage(std::ostream& out);

} // namespace lh
