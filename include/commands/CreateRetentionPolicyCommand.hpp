#pragma once

#include "commands/Command.hpp"
#include "remote/model/RetentionPolicy.hpp"

namespace qm::commands {

// Retention policies cannot be deleted, only retired; always runs as admin.
// A policy whose assignment fails is retired before execute rethrows.
class CreateRetentionPolicyCommand final : public DisposableCommand {
public:
    CreateRetentionPolicyCommand(std::string folderId, std::string policyName, Scope scope = Scope::Test);

    [[nodiscard]] std::string name() const override { return "create retention policy"; }

    ResourceId execute(remote::Client& client) override;
    void dispose(remote::Client& client) override;

    [[nodiscard]] const remote::model::RetentionPolicy& policy() const { return policy_; }
    [[nodiscard]] const remote::model::RetentionPolicyAssignment& assignment() const { return assignment_; }

private:
    std::string folderId_, policyName_;
    remote::model::RetentionPolicy policy_{};
    remote::model::RetentionPolicyAssignment assignment_{};

    // Rollback path: a failure here is logged, the assignment error is what propagates.
    void retireUnassigned(remote::Client& client) const;
};

}
