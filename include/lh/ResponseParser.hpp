/**
 * ResponseParser.hpp - Extract the four structured fields from a model reply
 */

#pragma once

#include <optional>
#include <string>

namespace lh {

extern const std::string FALLBACK_EXPLANATION;

struct LLMResponse {
    std::string explanation;
    std::optional<std::string> recommended_command;
    std::optional<std::string> warnings;
    std::optional<std::string> additional_info;

    bool operator==(const LLMResponse& other) const;
    bool operator!=(const LLMResponse& other) const { return !(*this == other); }
};

class ResponseParser {
public:
    // Never fails. Lines are trimmed, the first matching prefix per line wins,
    // later lines overwrite earlier ones, "NONE" marks an optional field absent.
    static LLMResponse parse(const std::string& raw_text);

    // Canonical four-line form, "NONE" for absent or empty optional fields.
    // parse(render(r)) == r holds when every present value is non-empty and trimmed.
    static std::string render(const LLMResponse& response);
};

} // namespace lh
