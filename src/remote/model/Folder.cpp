#include "remote/model/Folder.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace qm::remote::model;

void qm::remote::model::to_json(nlohmann::json& j, const Folder& f) {
    j = {
        {"type", "folder"},
        {"id", f.id},
        {"name", f.name},
        {"parent", {{"id", f.parent_id}}},
        {"owned_by", {{"id", f.owned_by}}},
        {"created_at", util::timestampToString(f.created_at)}
    };
}

void qm::remote::model::from_json(const nlohmann::json& j, Folder& f) {
    f.id = j.at("id").get<std::string>();
    f.name = j.at("name").get<std::string>();
    f.parent_id = j.contains("parent") ? j.at("parent").at("id").get<std::string>() : ROOT_FOLDER_ID;
    if (j.contains("owned_by")) f.owned_by = j.at("owned_by").at("id").get<std::string>();
    if (j.contains("created_at")) f.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
}

void qm::remote::model::to_json(nlohmann::json& j, const FolderRequest& r) {
    j = {
        {"name", r.name},
        {"parent", {{"id", r.parent_id}}}
    };
}
