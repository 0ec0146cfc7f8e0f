#include "resources/Resources.hpp"
#include "commands/CreateFileCommand.hpp"
#include "commands/CreateFolderCommand.hpp"
#include "commands/CreateRetentionPolicyCommand.hpp"
#include "commands/DeleteFileCommand.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "util/naming.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace qm::resources;
using namespace qm::commands;
using namespace qm::remote::model;

Resources::Resources(lifecycle::LifecycleController& controller, config::FixturesConfig fixtures)
    : controller_(controller), fixtures_(std::move(fixtures)) {}

File Resources::createSmallFile(const std::string& parentId, const Scope scope, const AccessLevel accessLevel) const {
    const auto command = std::make_shared<CreateFileCommand>(util::uniqueName("file"), smallFilePath(), parentId, scope, accessLevel);
    controller_.execute(command);
    return command->file();
}

File Resources::createSmallFileAsAdmin(const std::string& parentId) const {
    return createSmallFile(parentId, Scope::Test, AccessLevel::Admin);
}

File Resources::createFile(const std::vector<uint8_t>& content, const std::string& parentId,
                           const Scope scope, const AccessLevel accessLevel) const {
    const auto command = std::make_shared<CreateFileCommand>(util::uniqueName("file"), content, parentId, scope, accessLevel);
    controller_.execute(command);
    return command->file();
}

void Resources::deleteFile(const std::string& fileId) const {
    DeleteFileCommand command(fileId);
    controller_.execute(command);
}

Folder Resources::createFolder(const std::string& parentId, const Scope scope, const AccessLevel accessLevel) const {
    const auto command = std::make_shared<CreateFolderCommand>(util::uniqueName("folder"), parentId, scope, accessLevel);
    controller_.execute(command);
    return command->folder();
}

Folder Resources::createFolderAsAdmin(const std::string& parentId) const {
    return createFolder(parentId, Scope::Test, AccessLevel::Admin);
}

RetentionPolicy Resources::createRetentionPolicy(const std::string& folderId, const Scope scope) const {
    const auto command = std::make_shared<CreateRetentionPolicyCommand>(folderId, util::uniqueName("policy"), scope);
    controller_.execute(command);
    return command->policy();
}

std::filesystem::path Resources::smallFilePath() const { return fixtures_.data_dir / fixtures_.small_file; }

std::filesystem::path Resources::smallFileV2Path() const { return fixtures_.data_dir / fixtures_.small_file_v2; }

std::string Resources::readFixture(const std::string& name) const {
    const auto path = fixtures_.data_dir / name;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("[Resources] Unable to read fixture " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
