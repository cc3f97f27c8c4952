/**
 * Config.hpp - Runtime configuration loaded once from the environment
 */

#pragma once

#include <optional>
#include <string>

namespace lh {

class CommandRunner;
class SecretStore;

enum class Provider {
    OPENROUTER,
    OPENAI,
    ANTHROPIC,
    LOCAL,
    SIMULATION
};

// Case-sensitive; nullopt for unknown names
std::optional<Provider> providerFromString(const std::string& name);
std::string providerName(Provider provider);

struct Config {
    Provider provider = Provider::OPENROUTER;
    std::optional<std::string> api_key;
    std::optional<std::string> api_url;     // local or custom endpoint
    std::optional<std::string> model_name;
    bool debug_mode = false;

    // Reads LOCALHELP_* variables. The secret store is only consulted when
    // LOCALHELP_API_KEY is unset; any lookup failure leaves api_key empty.
    static Config fromEnvironment(SecretStore& secrets, CommandRunner& runner);
};

} // namespace lh
