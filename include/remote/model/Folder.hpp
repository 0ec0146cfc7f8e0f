#pragma once

#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace qm::remote::model {

// Id of the implicit root folder every principal sees.
inline constexpr const char* ROOT_FOLDER_ID = "0";

struct Folder {
    std::string id, name, parent_id, owned_by;
    std::time_t created_at{};
};

struct FolderRequest {
    std::string name;
    std::string parent_id{ROOT_FOLDER_ID};
};

void to_json(nlohmann::json& j, const Folder& f);
void from_json(const nlohmann::json& j, Folder& f);

void to_json(nlohmann::json& j, const FolderRequest& r);

}
