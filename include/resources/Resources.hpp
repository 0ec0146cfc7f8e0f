#pragma once

#include "commands/Command.hpp"
#include "config/Config.hpp"
#include "remote/model/File.hpp"
#include "remote/model/Folder.hpp"
#include "remote/model/RetentionPolicy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace qm::lifecycle { class LifecycleController; }

namespace qm::resources {

// Factories used from test bodies: build a uniquely named request, run it through
// the controller so it is tracked for its scope, hand back what was created.
class Resources {
public:
    Resources(lifecycle::LifecycleController& controller, config::FixturesConfig fixtures);

    remote::model::File createSmallFile(const std::string& parentId = remote::model::ROOT_FOLDER_ID,
                                        commands::Scope scope = commands::Scope::Test,
                                        commands::AccessLevel accessLevel = commands::AccessLevel::User) const;
    remote::model::File createSmallFileAsAdmin(const std::string& parentId) const;

    // Uploads `content` under a unique name; for size-sensitive tests.
    remote::model::File createFile(const std::vector<uint8_t>& content,
                                   const std::string& parentId = remote::model::ROOT_FOLDER_ID,
                                   commands::Scope scope = commands::Scope::Test,
                                   commands::AccessLevel accessLevel = commands::AccessLevel::User) const;

    void deleteFile(const std::string& fileId) const;

    remote::model::Folder createFolder(const std::string& parentId = remote::model::ROOT_FOLDER_ID,
                                       commands::Scope scope = commands::Scope::Test,
                                       commands::AccessLevel accessLevel = commands::AccessLevel::User) const;
    remote::model::Folder createFolderAsAdmin(const std::string& parentId) const;

    remote::model::RetentionPolicy createRetentionPolicy(const std::string& folderId = remote::model::ROOT_FOLDER_ID,
                                                         commands::Scope scope = commands::Scope::Test) const;

    [[nodiscard]] std::filesystem::path smallFilePath() const;
    [[nodiscard]] std::filesystem::path smallFileV2Path() const;
    [[nodiscard]] std::string readFixture(const std::string& name) const;

private:
    lifecycle::LifecycleController& controller_;
    config::FixturesConfig fixtures_;
};

}
