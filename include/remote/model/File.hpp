#pragma once

#include "remote/model/Folder.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace qm::remote::model {

struct File {
    std::string id, name, parent_id, owned_by;
    uintmax_t size{0};
    std::time_t created_at{};
};

struct FileRequest {
    std::string name;
    std::string parent_id{ROOT_FOLDER_ID};
};

void to_json(nlohmann::json& j, const File& f);
void from_json(const nlohmann::json& j, File& f);

void to_json(nlohmann::json& j, const FileRequest& r);

}
