#include "json.hpp"

#include <cmath>

// ─────────────────────────────────────
const nlohmann::json *JsonParse::Find(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        spdlog::debug("JsonParse: '{}' absent", key);
        return nullptr;
    }
    return &*it;
}

// ─────────────────────────────────────
void JsonParse::WrongType(const std::string &key, const char *expected,
                          const nlohmann::json &got) {
    spdlog::warn("JsonParse: '{}' should be {}, got {}; keeping default", key, expected,
                 got.type_name());
}

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    const nlohmann::json *v = Find(j, key);
    if (!v) {
        return fallback;
    }
    if (v->is_number_integer()) {
        return v->get<int>();
    }
    if (v->is_number_float()) {
        return static_cast<int>(std::lround(v->get<double>()));
    }
    WrongType(key, "an integer", *v);
    return fallback;
}

// ─────────────────────────────────────
double JsonParse::GetDouble(const nlohmann::json &j, const std::string &key, double fallback) {
    const nlohmann::json *v = Find(j, key);
    if (!v) {
        return fallback;
    }
    if (!v->is_number()) {
        WrongType(key, "a number", *v);
        return fallback;
    }
    return v->get<double>();
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    const nlohmann::json *v = Find(j, key);
    if (!v) {
        return fallback;
    }
    if (!v->is_boolean()) {
        WrongType(key, "a boolean", *v);
        return fallback;
    }
    return v->get<bool>();
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    const nlohmann::json *v = Find(j, key);
    if (!v) {
        return fallback;
    }
    if (!v->is_string()) {
        WrongType(key, "a string", *v);
        return fallback;
    }
    return v->get<std::string>();
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::GetStringList(const nlohmann::json &j, const std::string &key,
                                                  const std::vector<std::string> &fallback) {
    const nlohmann::json *v = Find(j, key);
    if (!v) {
        return fallback;
    }
    if (!v->is_array()) {
        WrongType(key, "a list of strings", *v);
        return fallback;
    }
    return JsonArray2String(*v);
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::JsonArray2String(const nlohmann::json &arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        return out;
    }
    out.reserve(arr.size());
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonParse: skipping {} in string list", v.type_name());
        }
    }
    return out;
}
