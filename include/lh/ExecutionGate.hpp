/**
 * ExecutionGate.hpp - Show the answer and run the recommended command on confirmation
 */

#pragma once

#include "lh/ResponseParser.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace lh {

class CommandRunner;

class ExecutionGate {
public:
    ExecutionGate(CommandRunner& runner, std::istream& in, std::ostream& out);

    void display(const LLMResponse& response);

    // Displays, then asks and executes if a command was recommended.
    // Returns true if a command was run.
    bool present(const LLMResponse& response);

    bool askConfirmation(const std::string& command);

    // Runs the command and reports the outcome. Throws Error(NO_COMMAND_TO_EXECUTE)
    // when the command splits to nothing; a failing child is only reported.
    void execute(const std::string& command);

    // Split on single spaces, empty fragments dropped
    static std::vector<std::string> splitCommand(const std::string& command);

    static bool isAffirmative(const std::string& answer);

private:
    CommandRunner& runner_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace lh
