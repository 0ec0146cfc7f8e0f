#pragma once

#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace qm::remote::model {

enum class PolicyStatus { Active, Retired };

std::string to_string(const PolicyStatus& status);
PolicyStatus policy_status_from_string(const std::string& str);

struct RetentionPolicy {
    std::string id, name;
    std::string policy_type{"finite"};
    unsigned int retention_length{1};   // days
    std::string disposition_action{"remove_retention"};
    PolicyStatus status{PolicyStatus::Active};
    std::time_t created_at{};
};

struct RetentionPolicyRequest {
    std::string name;
    std::string policy_type{"finite"};
    unsigned int retention_length{1};
    std::string disposition_action{"remove_retention"};
};

struct RetentionPolicyAssignment {
    std::string id, policy_id;
    std::string assigned_to_type{"enterprise"};   // "enterprise" or "folder"
    std::string assigned_to_id{};
};

void to_json(nlohmann::json& j, const RetentionPolicy& p);
void from_json(const nlohmann::json& j, RetentionPolicy& p);

void to_json(nlohmann::json& j, const RetentionPolicyRequest& r);

void to_json(nlohmann::json& j, const RetentionPolicyAssignment& a);
void from_json(const nlohmann::json& j, RetentionPolicyAssignment& a);

}
