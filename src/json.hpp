#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Lenient accessors for request bodies and config.json. A missing key or a value of the
// wrong type yields the fallback; only wrong types are worth a warning.
class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    double GetDouble(const nlohmann::json &j, const std::string &key, double fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    std::vector<std::string> GetStringList(const nlohmann::json &j, const std::string &key,
                                           const std::vector<std::string> &fallback);
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr);

  private:
    const nlohmann::json *Find(const nlohmann::json &j, const std::string &key);
    void WrongType(const std::string &key, const char *expected, const nlohmann::json &got);
};
