/**
 * UnsupportedSecretStore.cpp - SecretStore for builds without a keyring
 */

#include "lh/SecretStore.hpp"

namespace lh {

namespace {

class UnsupportedSecretStore : public SecretStore {
public:
    SecretLookup get(const std::string&, const std::string&) override {
        SecretLookup lookup;
        lookup.status = SecretStatus::KEY_NOT_FOUND;
        lookup.error = "no secret store available in this build";
        return lookup;
    }
};

} // anonymous namespace

std::unique_ptr<SecretStore> makeSecretStore() {
    return std::make_unique<UnsupportedSecretStore>();
}

} // namespace lh
