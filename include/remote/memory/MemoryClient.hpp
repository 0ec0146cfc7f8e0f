#pragma once

#include "remote/Client.hpp"

#include <memory>

namespace qm::remote::memory {

class MemoryBackend;

class MemoryClient final : public Client {
public:
    MemoryClient(std::shared_ptr<MemoryBackend> backend, std::string principal);

    [[nodiscard]] const std::string& principal() const override { return principal_; }

    model::User createEnterpriseUser(const model::UserRequest& request) override;
    model::User getUser(const std::string& userId) override;
    void deleteEnterpriseUser(const std::string& userId, bool notify, bool force) override;

    model::Folder createFolder(const model::FolderRequest& request) override;
    model::Folder getFolder(const std::string& folderId) override;
    void deleteFolder(const std::string& folderId, bool recursive) override;

    model::File uploadFile(const model::FileRequest& request, const std::vector<uint8_t>& content) override;
    model::File getFile(const std::string& fileId) override;
    void deleteFile(const std::string& fileId) override;

    model::RetentionPolicy createRetentionPolicy(const model::RetentionPolicyRequest& request) override;
    model::RetentionPolicy getRetentionPolicy(const std::string& policyId) override;
    model::RetentionPolicy retireRetentionPolicy(const std::string& policyId) override;
    model::RetentionPolicyAssignment assignRetentionPolicy(const std::string& policyId,
                                                           const std::string& assignedToType,
                                                           const std::string& assignedToId) override;

private:
    std::shared_ptr<MemoryBackend> backend_;
    std::string principal_;
};

}
