/**
 * Console.cpp - Terminal colors and debug logging
 */

#include "lh/Console.hpp"
#include "lh/Config.hpp"

#include <cstring>

namespace lh {
namespace console {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string CYAN = "\033[36m";

const std::string RULE = "═══════════════════════════";

void debug(const Config& config, const char* file, int line, const std::string& message) {
    if (!config.debug_mode) return;

    // Only the file name, not the build path
    const char* base = std::strrchr(file, '/');
    base = base ? base + 1 : file;

    std::cerr << "[DEBUG] " << base << ":" << line << " " << message << "\n";
}

std::string preview(const std::string& text, size_t limit) {
    return text.size() > limit ? text.substr(0, limit) : text;
}

} // namespace console
} // namespace lh
