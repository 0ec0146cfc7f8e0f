#include "remote/memory/MemoryClient.hpp"
#include "remote/memory/MemoryBackend.hpp"

#include <stdexcept>

using namespace qm::remote::memory;
using namespace qm::remote::model;

MemoryClient::MemoryClient(std::shared_ptr<MemoryBackend> backend, std::string principal)
    : backend_(std::move(backend)), principal_(std::move(principal)) {
    if (!backend_) throw std::runtime_error("[MemoryClient] Backend is null");
}

User MemoryClient::createEnterpriseUser(const UserRequest& request) { return backend_->createUser(principal_, request); }

User MemoryClient::getUser(const std::string& userId) { return backend_->getUser(principal_, userId); }

void MemoryClient::deleteEnterpriseUser(const std::string& userId, const bool notify, const bool force) {
    backend_->deleteUser(principal_, userId, notify, force);
}

Folder MemoryClient::createFolder(const FolderRequest& request) { return backend_->createFolder(principal_, request); }

Folder MemoryClient::getFolder(const std::string& folderId) { return backend_->getFolder(principal_, folderId); }

void MemoryClient::deleteFolder(const std::string& folderId, const bool recursive) {
    backend_->deleteFolder(principal_, folderId, recursive);
}

File MemoryClient::uploadFile(const FileRequest& request, const std::vector<uint8_t>& content) {
    return backend_->uploadFile(principal_, request, content);
}

File MemoryClient::getFile(const std::string& fileId) { return backend_->getFile(principal_, fileId); }

void MemoryClient::deleteFile(const std::string& fileId) { backend_->deleteFile(principal_, fileId); }

RetentionPolicy MemoryClient::createRetentionPolicy(const RetentionPolicyRequest& request) {
    return backend_->createRetentionPolicy(principal_, request);
}

RetentionPolicy MemoryClient::getRetentionPolicy(const std::string& policyId) {
    return backend_->getRetentionPolicy(principal_, policyId);
}

RetentionPolicy MemoryClient::retireRetentionPolicy(const std::string& policyId) {
    return backend_->retireRetentionPolicy(principal_, policyId);
}

RetentionPolicyAssignment MemoryClient::assignRetentionPolicy(const std::string& policyId,
                                                             const std::string& assignedToType,
                                                             const std::string& assignedToId) {
    return backend_->assignRetentionPolicy(principal_, policyId, assignedToType, assignedToId);
}
