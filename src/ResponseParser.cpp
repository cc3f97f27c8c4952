/**
 * ResponseParser.cpp - Extract the four structured fields from a model reply
 */

#include "lh/ResponseParser.hpp"

#include <sstream>

namespace lh {

const std::string FALLBACK_EXPLANATION = "Unable to parse explanation from response.";

namespace {

const std::string EXPLANATION_PREFIX = "EXPLANATION: ";
const std::string COMMAND_PREFIX = "COMMAND: ";
const std::string WARNINGS_PREFIX = "WARNINGS: ";
const std::string INFO_PREFIX = "INFO: ";
const std::string NONE = "NONE";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> optionalField(const std::string& value) {
    if (value == NONE) {
        return std::nullopt;
    }
    return value;
}

// Absent and empty values both render as NONE
std::string renderField(const std::optional<std::string>& value) {
    return value && !value->empty() ? *value : NONE;
}

} // anonymous namespace

bool LLMResponse::operator==(const LLMResponse& other) const {
    return explanation == other.explanation &&
           recommended_command == other.recommended_command &&
           warnings == other.warnings &&
           additional_info == other.additional_info;
}

LLMResponse ResponseParser::parse(const std::string& raw_text) {
    std::optional<std::string> explanation;
    LLMResponse response;

    std::istringstream iss(raw_text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;

        if (startsWith(trimmed, EXPLANATION_PREFIX)) {
            explanation = trimmed.substr(EXPLANATION_PREFIX.size());
        } else if (startsWith(trimmed, COMMAND_PREFIX)) {
            response.recommended_command = optionalField(trimmed.substr(COMMAND_PREFIX.size()));
        } else if (startsWith(trimmed, WARNINGS_PREFIX)) {
            response.warnings = optionalField(trimmed.substr(WARNINGS_PREFIX.size()));
        } else if (startsWith(trimmed, INFO_PREFIX)) {
            response.additional_info = optionalField(trimmed.substr(INFO_PREFIX.size()));
        }
    }

    response.explanation = explanation.value_or(FALLBACK_EXPLANATION);
    return response;
}

std::string ResponseParser::render(const LLMResponse& response) {
    std::ostringstream out;
    out << EXPLANATION_PREFIX << response.explanation << "\n"
        << COMMAND_PREFIX << renderField(response.recommended_command) << "\n"
        << WARNINGS_PREFIX << renderField(response.warnings) << "\n"
        << INFO_PREFIX << renderField(response.additional_info) << "\n";
    return out.str();
}

} // namespace lh
