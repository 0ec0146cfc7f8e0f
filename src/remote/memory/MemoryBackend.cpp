#include "remote/memory/MemoryBackend.hpp"
#include "config/ConnectionConfig.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ctime>

using namespace qm::remote;
using namespace qm::remote::memory;
using namespace qm::remote::model;

template <typename Fn>
auto MemoryBackend::guarded(const std::string& operation, const std::string& principal,
                            const std::string& resourceId, const nlohmann::json& payload, Fn&& fn) {
    std::scoped_lock lock(mutex_);
    calls_.push_back(CallRecord{operation, principal, resourceId, payload, true});
    try {
        if (const auto it = injected_.find(operation); it != injected_.end() && !it->second.empty()) {
            const auto error = it->second.front();
            it->second.pop_front();
            log::Registry::remote()->debug("[MemoryBackend] Injected failure for {}: {}", operation, error.what());
            throw error;
        }
        return fn();
    } catch (const ApiError&) {
        calls_.back().ok = false;
        throw;
    }
}

MemoryBackend::MemoryBackend(std::string enterpriseId, std::string clientId, std::string clientSecret)
    : enterpriseId_(std::move(enterpriseId)),
      clientId_(std::move(clientId)),
      clientSecret_(std::move(clientSecret)) {
    adminId_ = nextId();
    users_[adminId_] = User{
        .id = adminId_,
        .name = "Service Account",
        .login = "AutomationUser_" + adminId_ + "@service.local",
        .status = "active",
        .is_platform_access_only = false,
        .created_at = std::time(nullptr)
    };
}

std::string MemoryBackend::nextId() { return std::to_string(nextId_++); }

qm::config::ConnectionConfig MemoryBackend::connectionConfig(const std::optional<std::string>& userId) const {
    config::ConnectionConfig cfg;
    cfg.app_settings.client_id = clientId_;
    cfg.app_settings.client_secret = clientSecret_;
    cfg.app_settings.app_auth.public_key_id = "memory";
    cfg.app_settings.app_auth.private_key = "memory";
    cfg.enterprise_id = enterpriseId_;
    cfg.user_id = userId;
    return cfg;
}

void MemoryBackend::authenticate(const config::ConnectionConfig& config) {
    guarded("authenticate", config.app_settings.client_id, enterpriseId_, {}, [&] {
        if (config.app_settings.client_id != clientId_ || config.app_settings.client_secret != clientSecret_)
            throw ApiError::Unauthorized("Invalid client credentials");
        if (config.enterprise_id != enterpriseId_)
            throw ApiError::Unauthorized("Unknown enterprise: " + config.enterprise_id);
    });
}

void MemoryBackend::issueUserToken(const std::string& userId) {
    guarded("userToken", adminId_, userId, {}, [&] {
        if (!users_.contains(userId)) throw ApiError::NotFound("User " + userId);
        if (users_.at(userId).status != "active") throw ApiError(400, "user_not_active", "User " + userId + " is not active");
    });
}

// ---------- Users

User MemoryBackend::createUser(const std::string& principal, const UserRequest& request) {
    return guarded("createEnterpriseUser", principal, {}, nlohmann::json(request), [&] {
        requireAdmin(principal, "create users");
        if (request.name.empty()) throw ApiError(400, "bad_request", "User name must not be empty");

        User user;
        user.id = nextId();
        user.name = request.name;
        user.login = request.login.empty() ? "AppUser_" + user.id + "@" + enterpriseId_ + ".local" : request.login;
        user.is_platform_access_only = request.is_platform_access_only;
        user.created_at = std::time(nullptr);
        users_[user.id] = user;

        recordCreated(user.id);
        log::Registry::remote()->debug("[MemoryBackend] Created user {} ({})", user.id, user.name);
        return user;
    });
}

User MemoryBackend::getUser(const std::string& principal, const std::string& userId) {
    return guarded("getUser", principal, userId, {}, [&] {
        if (!isAdmin(principal) && principal != userId) throw ApiError::Forbidden("Cannot read user " + userId);
        const auto it = users_.find(userId);
        if (it == users_.end()) throw ApiError::NotFound("User " + userId);
        return it->second;
    });
}

void MemoryBackend::deleteUser(const std::string& principal, const std::string& userId, const bool notify, const bool force) {
    guarded("deleteEnterpriseUser", principal, userId, {{"notify", notify}, {"force", force}}, [&] {
        requireAdmin(principal, "delete users");
        if (userId == adminId_) throw ApiError(400, "bad_request", "The service account cannot be deleted");
        if (!users_.contains(userId)) throw ApiError::NotFound("User " + userId);

        std::vector<std::string> owned;
        for (const auto& [id, item] : items_)
            if (item.owned_by == userId) owned.push_back(id);

        if (!owned.empty() && !force)
            throw ApiError(400, "user_not_deletable", "User " + userId + " still owns " + std::to_string(owned.size()) + " item(s)");

        for (const auto& id : owned) eraseSubtree(id);
        users_.erase(userId);
        log::Registry::remote()->debug("[MemoryBackend] Deleted user {} ({} owned item(s) removed)", userId, owned.size());
    });
}

// ---------- Folders

Folder MemoryBackend::createFolder(const std::string& principal, const FolderRequest& request) {
    return guarded("createFolder", principal, {}, nlohmann::json(request), [&] {
        requireWritableParent(principal, request.parent_id);
        requireUniqueName(principal, request.parent_id, request.name);

        Item item{
            .kind = ItemKind::Folder,
            .id = nextId(),
            .name = request.name,
            .parent_id = request.parent_id,
            .owned_by = principal,
            .content = {},
            .created_at = std::time(nullptr)
        };
        items_[item.id] = item;

        recordCreated(item.id);
        return toFolder(item);
    });
}

Folder MemoryBackend::getFolder(const std::string& principal, const std::string& folderId) {
    return guarded("getFolder", principal, folderId, {}, [&] {
        return toFolder(requireItem(principal, folderId, ItemKind::Folder));
    });
}

void MemoryBackend::deleteFolder(const std::string& principal, const std::string& folderId, const bool recursive) {
    guarded("deleteFolder", principal, folderId, {{"recursive", recursive}}, [&] {
        requireItem(principal, folderId, ItemKind::Folder);
        if (!recursive && hasChildren(folderId))
            throw ApiError(400, "folder_not_empty", "Folder " + folderId + " is not empty");
        eraseSubtree(folderId);
    });
}

// ---------- Files

File MemoryBackend::uploadFile(const std::string& principal, const FileRequest& request, const std::vector<uint8_t>& content) {
    return guarded("uploadFile", principal, {}, nlohmann::json(request), [&] {
        requireWritableParent(principal, request.parent_id);
        requireUniqueName(principal, request.parent_id, request.name);

        Item item{
            .kind = ItemKind::File,
            .id = nextId(),
            .name = request.name,
            .parent_id = request.parent_id,
            .owned_by = principal,
            .content = content,
            .created_at = std::time(nullptr)
        };
        items_[item.id] = item;

        recordCreated(item.id);
        return toFile(item);
    });
}

File MemoryBackend::getFile(const std::string& principal, const std::string& fileId) {
    return guarded("getFile", principal, fileId, {}, [&] {
        return toFile(requireItem(principal, fileId, ItemKind::File));
    });
}

void MemoryBackend::deleteFile(const std::string& principal, const std::string& fileId) {
    guarded("deleteFile", principal, fileId, {}, [&] {
        requireItem(principal, fileId, ItemKind::File);
        items_.erase(fileId);
    });
}

// ---------- Retention policies

RetentionPolicy MemoryBackend::createRetentionPolicy(const std::string& principal, const RetentionPolicyRequest& request) {
    return guarded("createRetentionPolicy", principal, {}, nlohmann::json(request), [&] {
        requireAdmin(principal, "manage retention policies");
        const auto clash = std::ranges::any_of(policies_, [&](const auto& kv) { return kv.second.name == request.name; });
        if (clash) throw ApiError::Conflict("Retention policy name in use: " + request.name);

        RetentionPolicy policy;
        policy.id = nextId();
        policy.name = request.name;
        policy.policy_type = request.policy_type;
        policy.retention_length = request.retention_length;
        policy.disposition_action = request.disposition_action;
        policy.status = PolicyStatus::Active;
        policy.created_at = std::time(nullptr);
        policies_[policy.id] = policy;

        recordCreated(policy.id);
        return policy;
    });
}

RetentionPolicy MemoryBackend::getRetentionPolicy(const std::string& principal, const std::string& policyId) {
    return guarded("getRetentionPolicy", principal, policyId, {}, [&] {
        requireAdmin(principal, "read retention policies");
        const auto it = policies_.find(policyId);
        if (it == policies_.end()) throw ApiError::NotFound("Retention policy " + policyId);
        return it->second;
    });
}

RetentionPolicy MemoryBackend::retireRetentionPolicy(const std::string& principal, const std::string& policyId) {
    return guarded("retireRetentionPolicy", principal, policyId, {{"status", "retired"}}, [&] {
        requireAdmin(principal, "manage retention policies");
        const auto it = policies_.find(policyId);
        if (it == policies_.end()) throw ApiError::NotFound("Retention policy " + policyId);
        if (it->second.status == PolicyStatus::Retired)
            throw ApiError(400, "policy_already_retired", "Retention policy " + policyId + " is already retired");
        it->second.status = PolicyStatus::Retired;
        return it->second;
    });
}

RetentionPolicyAssignment MemoryBackend::assignRetentionPolicy(const std::string& principal, const std::string& policyId,
                                                              const std::string& assignedToType, const std::string& assignedToId) {
    const nlohmann::json payload = {
        {"policy_id", policyId},
        {"assign_to", {{"type", assignedToType}, {"id", assignedToId}}}
    };
    return guarded("assignRetentionPolicy", principal, policyId, payload, [&] {
        requireAdmin(principal, "assign retention policies");
        const auto it = policies_.find(policyId);
        if (it == policies_.end()) throw ApiError::NotFound("Retention policy " + policyId);
        if (it->second.status != PolicyStatus::Active)
            throw ApiError(400, "policy_not_active", "Retention policy " + policyId + " is retired");

        if (assignedToType == "folder") requireItem(principal, assignedToId, ItemKind::Folder);
        else if (assignedToType != "enterprise")
            throw ApiError(400, "bad_request", "Unsupported assignment target: " + assignedToType);

        RetentionPolicyAssignment assignment{
            .id = nextId(),
            .policy_id = policyId,
            .assigned_to_type = assignedToType,
            .assigned_to_id = assignedToType == "enterprise" ? enterpriseId_ : assignedToId
        };
        assignments_[assignment.id] = assignment;
        return assignment;
    });
}

// ---------- Failure injection and inspection

void MemoryBackend::failNext(const std::string& operation, ApiError error) {
    std::scoped_lock lock(mutex_);
    injected_[operation].push_back(std::move(error));
}

std::vector<CallRecord> MemoryBackend::calls() const {
    std::scoped_lock lock(mutex_);
    return calls_;
}

void MemoryBackend::clearCalls() {
    std::scoped_lock lock(mutex_);
    calls_.clear();
}

bool MemoryBackend::hasUser(const std::string& userId) const {
    std::scoped_lock lock(mutex_);
    return users_.contains(userId);
}

bool MemoryBackend::hasItem(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    return items_.contains(itemId);
}

std::size_t MemoryBackend::userCount() const {
    std::scoped_lock lock(mutex_);
    return users_.size() - 1;
}

std::size_t MemoryBackend::itemCount() const {
    std::scoped_lock lock(mutex_);
    return items_.size();
}

std::size_t MemoryBackend::activePolicyCount() const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(policies_, [](const auto& kv) {
        return kv.second.status == PolicyStatus::Active;
    }));
}

// ---------- Internals (mutex_ held)

void MemoryBackend::requireAdmin(const std::string& principal, const std::string& what) const {
    if (!isAdmin(principal)) throw ApiError::Forbidden("Only the enterprise admin may " + what);
}

MemoryBackend::Item& MemoryBackend::requireItem(const std::string& principal, const std::string& itemId, const ItemKind kind) {
    const auto it = items_.find(itemId);
    const auto label = kind == ItemKind::Folder ? "Folder " : "File ";
    if (it == items_.end() || it->second.kind != kind) throw ApiError::NotFound(label + itemId);
    if (!isAdmin(principal) && it->second.owned_by != principal)
        throw ApiError::Forbidden(label + itemId + " is not accessible to user " + principal);
    return it->second;
}

void MemoryBackend::requireWritableParent(const std::string& principal, const std::string& parentId) const {
    if (parentId == ROOT_FOLDER_ID) return;
    const auto it = items_.find(parentId);
    if (it == items_.end() || it->second.kind != ItemKind::Folder) throw ApiError::NotFound("Parent folder " + parentId);
    if (!isAdmin(principal) && it->second.owned_by != principal)
        throw ApiError::Forbidden("Parent folder " + parentId + " is not writable by user " + principal);
}

void MemoryBackend::requireUniqueName(const std::string& principal, const std::string& parentId, const std::string& name) const {
    if (name.empty()) throw ApiError(400, "bad_request", "Item name must not be empty");
    for (const auto& [id, item] : items_) {
        if (item.parent_id != parentId || item.name != name) continue;
        // every principal has a private root
        if (parentId == ROOT_FOLDER_ID && item.owned_by != principal) continue;
        throw ApiError::Conflict("Item with the same name already exists: " + name);
    }
}

bool MemoryBackend::hasChildren(const std::string& folderId) const {
    return std::ranges::any_of(items_, [&](const auto& kv) { return kv.second.parent_id == folderId; });
}

void MemoryBackend::eraseSubtree(const std::string& itemId) {
    std::vector<std::string> children;
    for (const auto& [id, item] : items_)
        if (item.parent_id == itemId) children.push_back(id);
    for (const auto& child : children) eraseSubtree(child);
    items_.erase(itemId);
}

Folder MemoryBackend::toFolder(const Item& item) {
    return Folder{
        .id = item.id,
        .name = item.name,
        .parent_id = item.parent_id,
        .owned_by = item.owned_by,
        .created_at = item.created_at
    };
}

File MemoryBackend::toFile(const Item& item) {
    return File{
        .id = item.id,
        .name = item.name,
        .parent_id = item.parent_id,
        .owned_by = item.owned_by,
        .size = item.content.size(),
        .created_at = item.created_at
    };
}
