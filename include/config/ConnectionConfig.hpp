#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace qm::config {

struct AppAuth {
    std::string public_key_id, private_key, passphrase;
};

struct AppSettings {
    std::string client_id, client_secret;
    AppAuth app_auth;
};

// Credentials handed to the session collaborator, in the service's JSON app config layout.
struct ConnectionConfig {
    AppSettings app_settings;
    std::string enterprise_id;
    std::optional<std::string> user_id{std::nullopt};

    [[nodiscard]] bool hasUserId() const { return user_id.has_value() && !user_id->empty(); }

    static ConnectionConfig fromJsonString(const std::string& json);

    // Environment variable first, JSON file second.
    static ConnectionConfig load(const ConnectionSourceConfig& source);
};

void to_json(nlohmann::json& j, const AppAuth& a);
void from_json(const nlohmann::json& j, AppAuth& a);

void to_json(nlohmann::json& j, const AppSettings& s);
void from_json(const nlohmann::json& j, AppSettings& s);

void to_json(nlohmann::json& j, const ConnectionConfig& c);
void from_json(const nlohmann::json& j, ConnectionConfig& c);

}
