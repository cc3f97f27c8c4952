/**
 * LibsecretStore.cpp - SecretStore backed by the desktop keyring (libsecret)
 *
 * Items are looked up by the "service" and "account" attributes, e.g.
 *   secret-tool store --label="localhelp" service localhelp-openrouter account $USER
 */

#include "lh/SecretStore.hpp"

#include <gio/gio.h>
#include <libsecret/secret.h>

namespace lh {

namespace {

const SecretSchema LOCALHELP_SCHEMA = {
    "org.localhelp.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

SecretStatus statusFromError(const GError* error) {
    if (error->domain == SECRET_ERROR && error->code == SECRET_ERROR_NO_SUCH_OBJECT) {
        return SecretStatus::KEY_NOT_FOUND;
    }
    if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_PERMISSION_DENIED) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED)) {
        return SecretStatus::ACCESS_DENIED;
    }
    if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT) ||
        g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_INVALID_ARGS)) {
        return SecretStatus::INVALID_PARAMETERS;
    }
    return SecretStatus::UNKNOWN_ERROR;
}

class LibsecretStore : public SecretStore {
public:
    SecretLookup get(const std::string& service, const std::string& account) override {
        SecretLookup lookup;

        if (service.empty() || account.empty()) {
            lookup.status = SecretStatus::INVALID_PARAMETERS;
            lookup.error = "service and account must not be empty";
            return lookup;
        }

        GError* error = nullptr;
        gchar* value = secret_password_lookup_sync(
            &LOCALHELP_SCHEMA,
            nullptr,
            &error,
            "service", service.c_str(),
            "account", account.c_str(),
            NULL
        );

        if (error != nullptr) {
            lookup.status = statusFromError(error);
            lookup.error = error->message;
            g_error_free(error);
            if (value != nullptr) {
                secret_password_free(value);
            }
            return lookup;
        }

        if (value == nullptr || value[0] == '\0') {
            lookup.status = SecretStatus::KEY_NOT_FOUND;
            if (value != nullptr) {
                secret_password_free(value);
            }
            return lookup;
        }

        lookup.status = SecretStatus::FOUND;
        lookup.value = value;
        secret_password_free(value);
        return lookup;
    }
};

} // anonymous namespace

std::unique_ptr<SecretStore> makeSecretStore() {
    return std::make_unique<LibsecretStore>();
}

} // namespace lh
