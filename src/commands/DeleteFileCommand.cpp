#include "commands/DeleteFileCommand.hpp"
#include "remote/Client.hpp"

using namespace qm::commands;

DeleteFileCommand::DeleteFileCommand(std::string fileId, const AccessLevel accessLevel)
    : CleanupCommand(accessLevel), fileId_(std::move(fileId)) {}

ResourceId DeleteFileCommand::execute(remote::Client& client) {
    client.deleteFile(fileId_);
    return fileId_;
}
