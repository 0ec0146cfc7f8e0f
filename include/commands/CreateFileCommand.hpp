#pragma once

#include "commands/Command.hpp"
#include "remote/model/File.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace qm::commands {

// Uploads either a file from disk or an in-memory buffer.
class CreateFileCommand final : public DisposableCommand {
public:
    CreateFileCommand(std::string fileName, std::filesystem::path sourcePath, std::string parentId,
                      Scope scope = Scope::Test, AccessLevel accessLevel = AccessLevel::User);

    CreateFileCommand(std::string fileName, std::vector<uint8_t> content, std::string parentId,
                      Scope scope = Scope::Test, AccessLevel accessLevel = AccessLevel::User);

    [[nodiscard]] std::string name() const override { return "create file"; }

    ResourceId execute(remote::Client& client) override;
    void dispose(remote::Client& client) override;

    [[nodiscard]] const remote::model::File& file() const { return file_; }

private:
    std::string fileName_, parentId_;
    std::optional<std::filesystem::path> sourcePath_;
    std::vector<uint8_t> content_;
    remote::model::File file_{};
};

}
