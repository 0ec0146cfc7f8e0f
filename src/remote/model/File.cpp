#include "remote/model/File.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace qm::remote::model;

void qm::remote::model::to_json(nlohmann::json& j, const File& f) {
    j = {
        {"type", "file"},
        {"id", f.id},
        {"name", f.name},
        {"size", f.size},
        {"parent", {{"id", f.parent_id}}},
        {"owned_by", {{"id", f.owned_by}}},
        {"created_at", util::timestampToString(f.created_at)}
    };
}

void qm::remote::model::from_json(const nlohmann::json& j, File& f) {
    f.id = j.at("id").get<std::string>();
    f.name = j.at("name").get<std::string>();
    f.size = j.value("size", static_cast<uintmax_t>(0));
    f.parent_id = j.contains("parent") ? j.at("parent").at("id").get<std::string>() : ROOT_FOLDER_ID;
    if (j.contains("owned_by")) f.owned_by = j.at("owned_by").at("id").get<std::string>();
    if (j.contains("created_at")) f.created_at = util::parseTimestampFromString(j.at("created_at").get<std::string>());
}

void qm::remote::model::to_json(nlohmann::json& j, const FileRequest& r) {
    j = {
        {"name", r.name},
        {"parent", {{"id", r.parent_id}}}
    };
}
