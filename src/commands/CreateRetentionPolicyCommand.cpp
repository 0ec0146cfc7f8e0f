#include "commands/CreateRetentionPolicyCommand.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace qm::commands;
using namespace qm::remote;

CreateRetentionPolicyCommand::CreateRetentionPolicyCommand(std::string folderId, std::string policyName, const Scope scope)
    : DisposableCommand(scope, AccessLevel::Admin),
      folderId_(std::move(folderId)),
      policyName_(std::move(policyName)) {}

ResourceId CreateRetentionPolicyCommand::execute(Client& client) {
    policy_ = client.createRetentionPolicy(model::RetentionPolicyRequest{
        .name = policyName_,
        .policy_type = "finite",
        .retention_length = 1,
        .disposition_action = "remove_retention"
    });

    try {
        // the root folder id stands for the whole enterprise
        if (folderId_ == model::ROOT_FOLDER_ID) assignment_ = client.assignRetentionPolicy(policy_.id, "enterprise", "");
        else assignment_ = client.assignRetentionPolicy(policy_.id, "folder", folderId_);
    } catch (const std::exception& e) {
        log::Registry::commands()->warn("[CreateRetentionPolicyCommand] Assigning policy {} failed, retiring it: {}",
                                        policy_.id, e.what());
        retireUnassigned(client);
        throw;
    }

    return policy_.id;
}

void CreateRetentionPolicyCommand::retireUnassigned(Client& client) const {
    try {
        client.retireRetentionPolicy(policy_.id);
    } catch (const std::exception& e) {
        log::Registry::commands()->error("[CreateRetentionPolicyCommand] Policy {} left active: {}", policy_.id, e.what());
    }
}

void CreateRetentionPolicyCommand::dispose(Client& client) {
    policy_ = client.retireRetentionPolicy(policy_.id);
}
