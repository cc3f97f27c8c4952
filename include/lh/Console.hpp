/**
 * Console.hpp - Terminal colors and debug logging
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace lh {

struct Config;

namespace console {

extern const std::string RESET;
extern const std::string BOLD;
extern const std::string RED;
extern const std::string GREEN;
extern const std::string YELLOW;
extern const std::string CYAN;

extern const std::string RULE;

// Writes "[DEBUG] file:line message" to stderr when debug mode is on
void debug(const Config& config, const char* file, int line, const std::string& message);

// First `limit` characters of text, for log previews
std::string preview(const std::string& text, size_t limit);

} // namespace console
} // namespace lh

#define LH_DEBUG(config, expr)                                              \
    do {                                                                    \
        if ((config).debug_mode) {                                          \
            std::ostringstream lh_debug_stream_;                            \
            lh_debug_stream_ << expr;                                       \
            ::lh::console::debug((config), __FILE__, __LINE__,              \
                                 lh_debug_stream_.str());                   \
        }                                                                   \
    } while (0)
