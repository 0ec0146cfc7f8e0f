#pragma once

#include "commands/Command.hpp"

namespace qm::commands {

class DeleteFileCommand final : public CleanupCommand {
public:
    explicit DeleteFileCommand(std::string fileId, AccessLevel accessLevel = AccessLevel::User);

    [[nodiscard]] std::string name() const override { return "delete file"; }

    ResourceId execute(remote::Client& client) override;

private:
    std::string fileId_;
};

}
