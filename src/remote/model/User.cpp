#include "remote/model/User.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace qm::remote::model;

void qm::remote::model::to_json(nlohmann::json& j, const User& u) {
    j = {
        {"type", "user"},
        {"id", u.id},
        {"name", u.name},
        {"login", u.login},
        {"status", u.status},
        {"is_platform_access_only", u.is_platform_access_only},
        {"created_at", util::timestampToString(u.created_at)}
    };
}

void qm::remote::model::from_json(const nlohmann::json& j, User& u) {
    u.id = j.at("id").get<std::string>();
    u.name = j.value("name", "");
    u.login = j.value("login", "");
    u.status = j.value("status", "active");
    u.is_platform_access_only = j.value("is_platform_access_only", false);
    if (j.contains("created_at")) u.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
}

void qm::remote::model::to_json(nlohmann::json& j, const UserRequest& r) {
    j = {
        {"name", r.name},
        {"is_platform_access_only", r.is_platform_access_only}
    };
    if (!r.login.empty()) j["login"] = r.login;
}
