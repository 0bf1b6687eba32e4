#pragma once

#include <string>
#include <libsecret/secret.h>

// Credentials kept in the desktop secret service instead of config.json.
class Secrets {
  public:
    Secrets();

    bool SaveSecret(const std::string &key, const std::string &value);
    std::string LoadSecret(const std::string &key);
    bool ClearSecret(const std::string &key);

    static constexpr const char *kScorerApiKey = "scorer_api_key";

  private:
    SecretSchema m_Schema;
};
