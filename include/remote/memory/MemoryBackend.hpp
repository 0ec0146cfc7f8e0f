#pragma once

#include "remote/ApiError.hpp"
#include "remote/model/User.hpp"
#include "remote/model/Folder.hpp"
#include "remote/model/File.hpp"
#include "remote/model/RetentionPolicy.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace qm::config { struct ConnectionConfig; }

namespace qm::remote::memory {

struct CallRecord {
    std::string operation;
    std::string principal;
    std::string resource_id{};   // target of the call, or the id it created
    nlohmann::json payload{};    // request body, when the call has one
    bool ok{true};
};

// In-process stand-in for the content service. Every principal sees its own root
// folder "0"; the service account (adminId()) may act on anything.
class MemoryBackend {
public:
    MemoryBackend(std::string enterpriseId, std::string clientId, std::string clientSecret);

    [[nodiscard]] const std::string& adminId() const { return adminId_; }
    [[nodiscard]] const std::string& enterpriseId() const { return enterpriseId_; }

    // A connection config this backend will accept.
    [[nodiscard]] config::ConnectionConfig connectionConfig(const std::optional<std::string>& userId = std::nullopt) const;

    void authenticate(const config::ConnectionConfig& config);

    model::User createUser(const std::string& principal, const model::UserRequest& request);
    model::User getUser(const std::string& principal, const std::string& userId);
    void deleteUser(const std::string& principal, const std::string& userId, bool notify, bool force);
    void issueUserToken(const std::string& userId);

    model::Folder createFolder(const std::string& principal, const model::FolderRequest& request);
    model::Folder getFolder(const std::string& principal, const std::string& folderId);
    void deleteFolder(const std::string& principal, const std::string& folderId, bool recursive);

    model::File uploadFile(const std::string& principal, const model::FileRequest& request, const std::vector<uint8_t>& content);
    model::File getFile(const std::string& principal, const std::string& fileId);
    void deleteFile(const std::string& principal, const std::string& fileId);

    model::RetentionPolicy createRetentionPolicy(const std::string& principal, const model::RetentionPolicyRequest& request);
    model::RetentionPolicy getRetentionPolicy(const std::string& principal, const std::string& policyId);
    model::RetentionPolicy retireRetentionPolicy(const std::string& principal, const std::string& policyId);
    model::RetentionPolicyAssignment assignRetentionPolicy(const std::string& principal, const std::string& policyId,
                                                           const std::string& assignedToType, const std::string& assignedToId);

    // The next call of `operation` (e.g. "deleteFolder") fails with `error`.
    void failNext(const std::string& operation, ApiError error);

    [[nodiscard]] std::vector<CallRecord> calls() const;
    void clearCalls();

    [[nodiscard]] bool hasUser(const std::string& userId) const;
    [[nodiscard]] bool hasItem(const std::string& itemId) const;
    [[nodiscard]] std::size_t userCount() const;      // excluding the service account
    [[nodiscard]] std::size_t itemCount() const;
    [[nodiscard]] std::size_t activePolicyCount() const;

private:
    enum class ItemKind { Folder, File };

    struct Item {
        ItemKind kind{ItemKind::Folder};
        std::string id, name, parent_id, owned_by;
        std::vector<uint8_t> content{};
        std::time_t created_at{};
    };

    std::string enterpriseId_, clientId_, clientSecret_, adminId_;

    mutable std::mutex mutex_;
    uint64_t nextId_{100000};
    std::unordered_map<std::string, model::User> users_;
    std::unordered_map<std::string, Item> items_;
    std::unordered_map<std::string, model::RetentionPolicy> policies_;
    std::unordered_map<std::string, model::RetentionPolicyAssignment> assignments_;
    std::unordered_map<std::string, std::deque<ApiError>> injected_;
    std::vector<CallRecord> calls_;

    std::string nextId();
    [[nodiscard]] bool isAdmin(const std::string& principal) const { return principal == adminId_; }

    // Records the call, throws an injected failure queued for `operation`, else runs fn
    // under the lock. Calls that end in ApiError are journaled as failed.
    template <typename Fn>
    auto guarded(const std::string& operation, const std::string& principal,
                 const std::string& resourceId, const nlohmann::json& payload, Fn&& fn);
    void recordCreated(const std::string& id) { calls_.back().resource_id = id; }

    void requireAdmin(const std::string& principal, const std::string& what) const;
    Item& requireItem(const std::string& principal, const std::string& itemId, ItemKind kind);
    void requireWritableParent(const std::string& principal, const std::string& parentId) const;
    void requireUniqueName(const std::string& principal, const std::string& parentId, const std::string& name) const;
    [[nodiscard]] bool hasChildren(const std::string& folderId) const;
    void eraseSubtree(const std::string& itemId);

    static model::Folder toFolder(const Item& item);
    static model::File toFile(const Item& item);
};

}
