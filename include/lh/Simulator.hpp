/**
 * Simulator.hpp - Offline canned responses keyed on prompt keywords
 */

#pragma once

#include "lh/ResponseParser.hpp"

#include <string>

namespace lh {

class Simulator {
public:
    // Deterministic, never fails, no credentials needed
    LLMResponse respond(const std::string& prompt) const;

    static bool hasDocumentation(const std::string& prompt);
};

} // namespace lh
