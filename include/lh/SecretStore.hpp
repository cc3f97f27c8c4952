/**
 * SecretStore.hpp - Read access to stored API credentials
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

namespace lh {

class CommandRunner;

enum class SecretStatus {
    FOUND,
    KEY_NOT_FOUND,
    ACCESS_DENIED,
    INVALID_PARAMETERS,
    UNKNOWN_ERROR
};

struct SecretLookup {
    SecretStatus status = SecretStatus::UNKNOWN_ERROR;
    std::string value;   // only meaningful when status == FOUND
    std::string error;

    bool found() const { return status == SecretStatus::FOUND; }
};

class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual SecretLookup get(const std::string& service, const std::string& account) = 0;
};

// Platform store selected at build time (libsecret or unsupported)
std::unique_ptr<SecretStore> makeSecretStore();

const char* secretStatusName(SecretStatus status);

// "openrouter" -> "localhelp-openrouter"; unknown names map to "localhelp-unknown"
std::string secretServiceName(const std::string& provider);

// $USER, falling back to `whoami`
std::optional<std::string> currentUser(CommandRunner& runner);

} // namespace lh
