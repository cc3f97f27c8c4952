/**
 * SecretStore.cpp - Service naming and account lookup shared by all stores
 */

#include "lh/SecretStore.hpp"
#include "lh/Subprocess.hpp"

#include <cstdlib>

namespace lh {

const char* secretStatusName(SecretStatus status) {
    switch (status) {
        case SecretStatus::FOUND:              return "Found";
        case SecretStatus::KEY_NOT_FOUND:      return "KeyNotFound";
        case SecretStatus::ACCESS_DENIED:      return "AccessDenied";
        case SecretStatus::INVALID_PARAMETERS: return "InvalidParameters";
        case SecretStatus::UNKNOWN_ERROR:      return "UnknownError";
    }
    return "UnknownError";
}

std::string secretServiceName(const std::string& provider) {
    if (provider == "openrouter") return "localhelp-openrouter";
    if (provider == "openai") return "localhelp-openai";
    if (provider == "anthropic") return "localhelp-anthropic";
    return "localhelp-unknown";
}

std::optional<std::string> currentUser(CommandRunner& runner) {
    const char* user = std::getenv("USER");
    if (user != nullptr) {
        return std::string(user);
    }

    auto result = runner.run({"whoami"}, "", 256);
    if (!result.exitedWith(0)) {
        return std::nullopt;
    }

    std::string name = result.stdout_text;
    name.erase(0, name.find_first_not_of(" \t\r\n"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

} // namespace lh
