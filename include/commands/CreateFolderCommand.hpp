#pragma once

#include "commands/Command.hpp"
#include "remote/model/Folder.hpp"

namespace qm::commands {

class CreateFolderCommand final : public DisposableCommand {
public:
    CreateFolderCommand(std::string folderName, std::string parentId,
                        Scope scope = Scope::Test, AccessLevel accessLevel = AccessLevel::User);

    [[nodiscard]] std::string name() const override { return "create folder"; }

    ResourceId execute(remote::Client& client) override;
    void dispose(remote::Client& client) override;

    [[nodiscard]] const remote::model::Folder& folder() const { return folder_; }

private:
    std::string folderName_, parentId_;
    remote::model::Folder folder_{};
};

}
