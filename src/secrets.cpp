#include "secrets.hpp"

#include <spdlog/spdlog.h>

namespace {
// Logs a secret service failure and frees the error. Returns true when there was one.
bool report(GError *&error, const char *action, const std::string &key) {
    if (!error) {
        return false;
    }
    spdlog::warn("Secrets: could not {} '{}': {}", action, key, error->message);
    g_clear_error(&error);
    return true;
}
} // namespace

// ─────────────────────────────────────
Secrets::Secrets()
    : m_Schema{"io.steadfast.Secret",
               SECRET_SCHEMA_NONE,
               {{"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, static_cast<SecretSchemaAttributeType>(0)}}} {}

// ─────────────────────────────────────
bool Secrets::SaveSecret(const std::string &key, const std::string &value) {
    if (key.empty() || value.empty()) {
        return false;
    }

    GError *error = nullptr;
    const std::string label = "Steadfast " + key;
    const gboolean stored =
        secret_password_store_sync(&m_Schema, SECRET_COLLECTION_DEFAULT, label.c_str(),
                                   value.c_str(), nullptr, &error, "key", key.c_str(), nullptr);
    if (report(error, "store", key)) {
        return false;
    }
    spdlog::debug("Secrets: stored '{}'", key);
    return stored;
}

// ─────────────────────────────────────
std::string Secrets::LoadSecret(const std::string &key) {
    std::string value;
    if (key.empty()) {
        return value;
    }

    GError *error = nullptr;
    gchar *secret =
        secret_password_lookup_sync(&m_Schema, nullptr, &error, "key", key.c_str(), nullptr);
    if (!report(error, "look up", key) && secret) {
        value = secret;
    }
    if (secret) {
        secret_password_free(secret);
    }
    return value;
}

// ─────────────────────────────────────
bool Secrets::ClearSecret(const std::string &key) {
    if (key.empty()) {
        return false;
    }

    GError *error = nullptr;
    const gboolean removed =
        secret_password_clear_sync(&m_Schema, nullptr, &error, "key", key.c_str(), nullptr);
    return !report(error, "remove", key) && removed;
}
