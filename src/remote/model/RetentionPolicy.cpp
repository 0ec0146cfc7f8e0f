#include "remote/model/RetentionPolicy.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace qm::remote::model;

std::string qm::remote::model::to_string(const PolicyStatus& status) {
    switch (status) {
        case PolicyStatus::Active: return "active";
        case PolicyStatus::Retired: return "retired";
        default: return "unknown";
    }
}

PolicyStatus qm::remote::model::policy_status_from_string(const std::string& str) {
    if (str == "active") return PolicyStatus::Active;
    if (str == "retired") return PolicyStatus::Retired;
    throw std::invalid_argument("Invalid retention policy status: " + str);
}

void qm::remote::model::to_json(nlohmann::json& j, const RetentionPolicy& p) {
    j = {
        {"type", "retention_policy"},
        {"id", p.id},
        {"policy_name", p.name},
        {"policy_type", p.policy_type},
        {"retention_length", p.retention_length},
        {"disposition_action", p.disposition_action},
        {"status", to_string(p.status)},
        {"created_at", util::timestampToString(p.created_at)}
    };
}

void qm::remote::model::from_json(const nlohmann::json& j, RetentionPolicy& p) {
    p.id = j.at("id").get<std::string>();
    p.name = j.at("policy_name").get<std::string>();
    p.policy_type = j.value("policy_type", "finite");
    p.retention_length = j.value("retention_length", 1u);
    p.disposition_action = j.value("disposition_action", "remove_retention");
    p.status = policy_status_from_string(j.value("status", "active"));
    if (j.contains("created_at")) p.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
}

void qm::remote::model::to_json(nlohmann::json& j, const RetentionPolicyRequest& r) {
    j = {
        {"policy_name", r.name},
        {"policy_type", r.policy_type},
        {"retention_length", r.retention_length},
        {"disposition_action", r.disposition_action}
    };
}

void qm::remote::model::to_json(nlohmann::json& j, const RetentionPolicyAssignment& a) {
    j = {
        {"type", "retention_policy_assignment"},
        {"id", a.id},
        {"retention_policy", {{"id", a.policy_id}}},
        {"assigned_to", {{"type", a.assigned_to_type}, {"id", a.assigned_to_id}}}
    };
}

void qm::remote::model::from_json(const nlohmann::json& j, RetentionPolicyAssignment& a) {
    a.id = j.at("id").get<std::string>();
    a.policy_id = j.at("retention_policy").at("id").get<std::string>();
    a.assigned_to_type = j.at("assigned_to").at("type").get<std::string>();
    a.assigned_to_id = j.at("assigned_to").value("id", "");
}
