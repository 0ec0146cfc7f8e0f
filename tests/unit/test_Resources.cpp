#include <gtest/gtest.h>
#include "resources/Resources.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "lifecycle/SessionState.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/ConnectionConfig.hpp"
#include "remote/Client.hpp"
#include "remote/memory/MemoryBackend.hpp"
#include "remote/memory/MemorySession.hpp"
#include "util/naming.hpp"

#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace qm;
using namespace qm::commands;
using namespace qm::lifecycle;
using namespace qm::remote::model;
using namespace qm::remote::memory;

class ResourcesTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryBackend> backend = std::make_shared<MemoryBackend>("ent-resources", "res-client", "res-secret");
    LifecycleController controller{MemorySession::factory(backend)};
    resources::Resources helpers{controller, config::ConfigRegistry::get().fixtures};

    void SetUp() override {
        controller.startRun(backend->connectionConfig());
        controller.startClass();
        controller.startTest();
    }

    void TearDown() override {
        if (controller.state() == LifecycleState::TestActive) controller.endTest();
        if (controller.state() == LifecycleState::ClassActive) controller.endClass();
        controller.endRun();
    }

    [[nodiscard]] bool called(const std::string& operation) const {
        const auto calls = backend->calls();
        return std::ranges::any_of(calls, [&](const CallRecord& c) { return c.operation == operation; });
    }
};

TEST_F(ResourcesTest, CreateSmallFile_UploadsFixtureAsUser) {
    const auto file = helpers.createSmallFile();

    EXPECT_TRUE(file.name.starts_with("file - "));
    EXPECT_EQ(file.parent_id, ROOT_FOLDER_ID);
    EXPECT_EQ(file.owned_by, controller.session().userId());
    EXPECT_EQ(file.size, fs::file_size(helpers.smallFilePath()));
    EXPECT_EQ(controller.pendingResources(Scope::Test), std::vector<ResourceId>{file.id});

    controller.endTest();
    EXPECT_FALSE(backend->hasItem(file.id));
}

TEST_F(ResourcesTest, CreateSmallFile_ClassScopedOutlivesTest) {
    const auto file = helpers.createSmallFile(ROOT_FOLDER_ID, Scope::Class);

    controller.endTest();
    EXPECT_TRUE(backend->hasItem(file.id));

    controller.endClass();
    EXPECT_FALSE(backend->hasItem(file.id));
}

TEST_F(ResourcesTest, AdminHelpers_RunAsAdmin) {
    const auto folder = helpers.createFolderAsAdmin(ROOT_FOLDER_ID);
    const auto file = helpers.createSmallFileAsAdmin(folder.id);

    const auto& adminId = controller.session().adminClient().principal();
    EXPECT_EQ(folder.owned_by, adminId);
    EXPECT_EQ(file.owned_by, adminId);
    EXPECT_EQ(file.parent_id, folder.id);

    // the shared user cannot see admin content
    EXPECT_THROW(controller.session().userClient().getFile(file.id), remote::ApiError);
}

TEST_F(ResourcesTest, CreateFolder_NestedDisposesChildFirst) {
    const auto parent = helpers.createFolder();
    const auto child = helpers.createFolder(parent.id);
    const auto file = helpers.createSmallFile(child.id);

    EXPECT_EQ(child.parent_id, parent.id);
    EXPECT_TRUE(parent.name.starts_with("folder - "));
    EXPECT_NE(parent.name, child.name);

    backend->clearCalls();
    controller.endTest();

    const auto calls = backend->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].resource_id, file.id);
    EXPECT_EQ(calls[1].resource_id, child.id);
    EXPECT_EQ(calls[2].resource_id, parent.id);
    EXPECT_TRUE(std::ranges::all_of(calls, [](const CallRecord& c) { return c.ok; }));
}

TEST_F(ResourcesTest, CreateFile_UploadsBuffer) {
    const auto content = util::randomContent(4096);
    const auto file = helpers.createFile(content);
    EXPECT_EQ(file.size, 4096u);
    EXPECT_TRUE(backend->hasItem(file.id));
}

TEST_F(ResourcesTest, DeleteFile_IsNotTracked) {
    const auto file = controller.session().userClient().uploadFile(FileRequest{.name = util::uniqueName("loose")}, {42});

    helpers.deleteFile(file.id);
    EXPECT_FALSE(backend->hasItem(file.id));
    EXPECT_EQ(controller.pending(Scope::Test), 0u);
}

TEST_F(ResourcesTest, DeleteFile_UnknownIdPropagates) {
    EXPECT_THROW(helpers.deleteFile("999999999"), remote::ApiError);
}

TEST_F(ResourcesTest, CreateRetentionPolicy_EnterpriseWideByDefault) {
    const auto policy = helpers.createRetentionPolicy();

    EXPECT_TRUE(policy.name.starts_with("policy - "));
    EXPECT_EQ(policy.policy_type, "finite");
    EXPECT_EQ(policy.retention_length, 1u);
    EXPECT_EQ(policy.disposition_action, "remove_retention");
    EXPECT_EQ(backend->activePolicyCount(), 1u);

    const auto calls = backend->calls();
    const auto assign = std::ranges::find_if(calls, [](const CallRecord& c) { return c.operation == "assignRetentionPolicy"; });
    ASSERT_NE(assign, calls.end());
    EXPECT_EQ(assign->principal, controller.session().adminClient().principal());
    EXPECT_EQ(assign->payload.at("assign_to").at("type").get<std::string>(), "enterprise");

    controller.endTest();
    EXPECT_EQ(backend->activePolicyCount(), 0u);
    EXPECT_EQ(controller.session().adminClient().getRetentionPolicy(policy.id).status, PolicyStatus::Retired);
}

TEST_F(ResourcesTest, CreateRetentionPolicy_AssignsToFolder) {
    const auto folder = helpers.createFolderAsAdmin(ROOT_FOLDER_ID);
    backend->clearCalls();

    helpers.createRetentionPolicy(folder.id);

    const auto calls = backend->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].operation, "assignRetentionPolicy");
    EXPECT_EQ(calls[1].payload.at("assign_to").at("type").get<std::string>(), "folder");
    EXPECT_EQ(calls[1].payload.at("assign_to").at("id").get<std::string>(), folder.id);
}

TEST_F(ResourcesTest, FailedHelperLeavesNothingTracked) {
    backend->failNext("uploadFile", remote::ApiError::Conflict("Item with the same name already exists"));
    EXPECT_THROW(helpers.createSmallFile(), remote::ApiError);
    EXPECT_EQ(controller.pending(Scope::Test), 0u);
    EXPECT_FALSE(called("deleteFile"));
}

TEST_F(ResourcesTest, FailedPolicyAssignmentRetiresPolicy) {
    backend->failNext("assignRetentionPolicy", remote::ApiError(500, "internal_server_error", "assignment unavailable"));

    EXPECT_THROW(helpers.createRetentionPolicy(), remote::ApiError);
    EXPECT_EQ(controller.pending(Scope::Test), 0u);
    EXPECT_TRUE(called("retireRetentionPolicy"));
    EXPECT_EQ(backend->activePolicyCount(), 0u);

    controller.endTest();
    controller.endClass();
    EXPECT_EQ(backend->activePolicyCount(), 0u);
}

TEST_F(ResourcesTest, FailedRollbackKeepsAssignmentError) {
    backend->failNext("assignRetentionPolicy", remote::ApiError(500, "internal_server_error", "assignment unavailable"));
    backend->failNext("retireRetentionPolicy", remote::ApiError(503, "unavailable", "retire unavailable"));

    try {
        static_cast<void>(helpers.createRetentionPolicy());
        ADD_FAILURE() << "[ResourcesTest] Expected createRetentionPolicy to throw";
    } catch (const remote::ApiError& e) {
        EXPECT_EQ(e.status(), 500);
    }
    EXPECT_EQ(controller.pending(Scope::Test), 0u);
}

TEST_F(ResourcesTest, Fixtures_ResolveAgainstDataDir) {
    EXPECT_TRUE(fs::exists(helpers.smallFilePath()));
    EXPECT_TRUE(fs::exists(helpers.smallFileV2Path()));
    EXPECT_NE(fs::file_size(helpers.smallFilePath()), fs::file_size(helpers.smallFileV2Path()));

    EXPECT_TRUE(helpers.readFixture("smalltest.pdf").starts_with("%PDF-"));
    try {
        static_cast<void>(helpers.readFixture("missing.pdf"));
        ADD_FAILURE() << "[ResourcesTest] Expected readFixture to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_TRUE(std::string(e.what()).starts_with("[Resources] "));
    }
}

TEST(NamingTest, UniqueName_LabelPlusUuid) {
    const auto a = util::uniqueName("folder");
    const auto b = util::uniqueName("folder");

    EXPECT_TRUE(a.starts_with("folder - "));
    EXPECT_EQ(a.size(), std::string("folder - ").size() + 36);
    EXPECT_NE(a, b);
}

TEST(NamingTest, RandomContent_HasRequestedSize) {
    EXPECT_TRUE(util::randomContent(0).empty());
    EXPECT_EQ(util::randomContent(1024).size(), 1024u);
}
