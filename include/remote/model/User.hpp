#pragma once

#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace qm::remote::model {

struct User {
    std::string id, name, login;
    std::string status{"active"};
    bool is_platform_access_only{false};
    std::time_t created_at{};
};

struct UserRequest {
    std::string name;
    std::string login{};
    bool is_platform_access_only{false};
};

void to_json(nlohmann::json& j, const User& u);
void from_json(const nlohmann::json& j, User& u);

void to_json(nlohmann::json& j, const UserRequest& r);

}
