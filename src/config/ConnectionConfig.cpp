#include "config/ConnectionConfig.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace qm::config;

static std::string requireString(const nlohmann::json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key) || !j.at(key).is_string())
        throw std::runtime_error("[ConnectionConfig] Missing required field '" + where + key + "'");
    return j.at(key).get<std::string>();
}

static std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("[ConnectionConfig] Unable to read connection config: " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void qm::config::to_json(nlohmann::json& j, const AppAuth& a) {
    j = {
        {"publicKeyID", a.public_key_id},
        {"privateKey", a.private_key},
        {"passphrase", a.passphrase}
    };
}

void qm::config::from_json(const nlohmann::json& j, AppAuth& a) {
    a.public_key_id = requireString(j, "publicKeyID", "boxAppSettings.appAuth.");
    a.private_key = requireString(j, "privateKey", "boxAppSettings.appAuth.");
    a.passphrase = j.value("passphrase", "");
}

void qm::config::to_json(nlohmann::json& j, const AppSettings& s) {
    j = {
        {"clientID", s.client_id},
        {"clientSecret", s.client_secret},
        {"appAuth", s.app_auth}
    };
}

void qm::config::from_json(const nlohmann::json& j, AppSettings& s) {
    s.client_id = requireString(j, "clientID", "boxAppSettings.");
    s.client_secret = requireString(j, "clientSecret", "boxAppSettings.");
    if (!j.contains("appAuth")) throw std::runtime_error("[ConnectionConfig] Missing required field 'boxAppSettings.appAuth'");
    j.at("appAuth").get_to(s.app_auth);
}

void qm::config::to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = {
        {"boxAppSettings", c.app_settings},
        {"enterpriseID", c.enterprise_id}
    };
    if (c.user_id) j["userID"] = *c.user_id;
}

void qm::config::from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (!j.is_object()) throw std::runtime_error("[ConnectionConfig] Connection config must be a JSON object");
    if (!j.contains("boxAppSettings")) throw std::runtime_error("[ConnectionConfig] Missing required field 'boxAppSettings'");
    j.at("boxAppSettings").get_to(c.app_settings);
    c.enterprise_id = requireString(j, "enterpriseID", "");

    c.user_id = std::nullopt;
    if (j.contains("userID") && !j.at("userID").is_null()) {
        const auto& id = j.at("userID");
        c.user_id = id.is_string() ? id.get<std::string>() : id.dump();
    }
}

ConnectionConfig ConnectionConfig::fromJsonString(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("[ConnectionConfig] Invalid JSON: ") + e.what());
    }
    return j.get<ConnectionConfig>();
}

ConnectionConfig ConnectionConfig::load(const ConnectionSourceConfig& source) {
    if (const char* env = std::getenv(source.env_var.c_str()); env && *env) {
        log::Registry::session()->debug("[ConnectionConfig] Using connection config from ${}", source.env_var);
        return fromJsonString(env);
    }

    log::Registry::session()->debug("[ConnectionConfig] No JSON config found in ${}, reading from {}",
                                    source.env_var, source.json_file.string());
    return fromJsonString(readFile(source.json_file));
}
