#include "commands/CreateFileCommand.hpp"
#include "remote/Client.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace qm::commands;
using namespace qm::remote;

static std::vector<uint8_t> readBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("[CreateFileCommand] Unable to open upload source " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

CreateFileCommand::CreateFileCommand(std::string fileName, std::filesystem::path sourcePath, std::string parentId,
                                     const Scope scope, const AccessLevel accessLevel)
    : DisposableCommand(scope, accessLevel),
      fileName_(std::move(fileName)),
      parentId_(std::move(parentId)),
      sourcePath_(std::move(sourcePath)) {}

CreateFileCommand::CreateFileCommand(std::string fileName, std::vector<uint8_t> content, std::string parentId,
                                     const Scope scope, const AccessLevel accessLevel)
    : DisposableCommand(scope, accessLevel),
      fileName_(std::move(fileName)),
      parentId_(std::move(parentId)),
      content_(std::move(content)) {}

ResourceId CreateFileCommand::execute(Client& client) {
    const model::FileRequest request{.name = fileName_, .parent_id = parentId_};
    file_ = sourcePath_ ? client.uploadFile(request, readBytes(*sourcePath_)) : client.uploadFile(request, content_);
    return file_.id;
}

void CreateFileCommand::dispose(Client& client) {
    client.deleteFile(file_.id);
}
