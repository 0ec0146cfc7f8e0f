#include "commands/CreateFolderCommand.hpp"
#include "remote/Client.hpp"

using namespace qm::commands;
using namespace qm::remote;

CreateFolderCommand::CreateFolderCommand(std::string folderName, std::string parentId,
                                         const Scope scope, const AccessLevel accessLevel)
    : DisposableCommand(scope, accessLevel),
      folderName_(std::move(folderName)),
      parentId_(std::move(parentId)) {}

ResourceId CreateFolderCommand::execute(Client& client) {
    folder_ = client.createFolder(model::FolderRequest{.name = folderName_, .parent_id = parentId_});
    return folder_.id;
}

void CreateFolderCommand::dispose(Client& client) {
    client.deleteFolder(folder_.id, true);
}
