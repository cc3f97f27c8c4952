/**
 * CommandParser.cpp - Split the argument vector into command, arguments and query
 */

#include "lh/CommandParser.hpp"
#include "lh/Error.hpp"

namespace lh {

namespace {

// Only checked on the last argument, case-sensitive
const std::vector<std::string> QUERY_WORDS = {
    "I ", "help", "want", "need", "how"
};

bool containsQueryWord(const std::string& arg) {
    for (const auto& word : QUERY_WORDS) {
        if (arg.find(word) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

bool CommandParser::isQueryStart(const std::string& arg, bool is_last) const {
    if (arg.find(' ') != std::string::npos) {
        return true;
    }

    if (!arg.empty() && (arg.front() == '\'' || arg.front() == '"')) {
        return true;
    }

    return is_last && containsQueryWord(arg);
}

std::string CommandParser::stripQuotes(const std::string& fragment) {
    if (fragment.size() >= 2) {
        char first = fragment.front();
        if ((first == '\'' || first == '"') && fragment.back() == first) {
            return fragment.substr(1, fragment.size() - 2);
        }
    }
    return fragment;
}

CommandInfo CommandParser::split(const std::vector<std::string>& args) const {
    if (args.empty() || args[0].empty()) {
        throw Error(ErrorCode::NO_COMMAND, "No command given");
    }

    CommandInfo info;
    info.command = args[0];

    for (size_t i = 1; i < args.size(); ++i) {
        bool is_last = (i == args.size() - 1);

        if (!isQueryStart(args[i], is_last)) {
            info.args.push_back(args[i]);
            continue;
        }

        // This and every following argument belong to the query
        std::string query;
        for (size_t j = i; j < args.size(); ++j) {
            if (j > i) query += " ";
            query += stripQuotes(args[j]);
        }
        info.query = query;
        break;
    }

    return info;
}

} // namespace lh
