/**
 * CommandParser.hpp - Split the argument vector into command, arguments and query
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lh {

struct CommandInfo {
    std::string command;
    std::vector<std::string> args;      // arguments before the query
    std::optional<std::string> query;   // absent when no argument looks like a query
};

class CommandParser {
public:
    // args[0] is the target command. Throws Error(NO_COMMAND) if it is missing or empty.
    CommandInfo split(const std::vector<std::string>& args) const;

    // True if `arg` opens the free-text query; `is_last` enables the keyword check
    bool isQueryStart(const std::string& arg, bool is_last) const;

    // Removes one pair of matching surrounding quotes
    static std::string stripQuotes(const std::string& fragment);
};

} // namespace lh
