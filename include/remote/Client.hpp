#pragma once

#include "remote/model/User.hpp"
#include "remote/model/Folder.hpp"
#include "remote/model/File.hpp"
#include "remote/model/RetentionPolicy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace qm::remote {

// A credentialed handle on the content service. Every call blocks until the
// service answers and throws ApiError on failure.
class Client {
public:
    virtual ~Client() = default;

    // Id of the user the handle acts as.
    [[nodiscard]] virtual const std::string& principal() const = 0;

    // Users (enterprise admin only)
    virtual model::User createEnterpriseUser(const model::UserRequest& request) = 0;
    virtual model::User getUser(const std::string& userId) = 0;
    virtual void deleteEnterpriseUser(const std::string& userId, bool notify, bool force) = 0;

    // Folders
    virtual model::Folder createFolder(const model::FolderRequest& request) = 0;
    virtual model::Folder getFolder(const std::string& folderId) = 0;
    virtual void deleteFolder(const std::string& folderId, bool recursive) = 0;

    // Files
    virtual model::File uploadFile(const model::FileRequest& request, const std::vector<uint8_t>& content) = 0;
    virtual model::File getFile(const std::string& fileId) = 0;
    virtual void deleteFile(const std::string& fileId) = 0;

    // Retention policies (enterprise admin only)
    virtual model::RetentionPolicy createRetentionPolicy(const model::RetentionPolicyRequest& request) = 0;
    virtual model::RetentionPolicy getRetentionPolicy(const std::string& policyId) = 0;
    virtual model::RetentionPolicy retireRetentionPolicy(const std::string& policyId) = 0;
    virtual model::RetentionPolicyAssignment assignRetentionPolicy(const std::string& policyId,
                                                                   const std::string& assignedToType,
                                                                   const std::string& assignedToId) = 0;
};

}
