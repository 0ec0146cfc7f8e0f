#include "LeakCheckEnvironment.hpp"
#include "harness/IntegrationTestBase.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "lifecycle/SessionState.hpp"
#include "resources/Resources.hpp"
#include "remote/ApiError.hpp"
#include "remote/Client.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace qm;
using namespace qm::commands;
using namespace qm::remote::model;
using namespace qm::test;

class AdminResourcesTest : public harness::IntegrationTestBase {
protected:
    // every policy a test creates is retired when its scope closes
    void TearDown() override {
        IntegrationTestBase::TearDown();
        EXPECT_EQ(LeakCheckEnvironment::backend().activePolicyCount(), 0u) << "[AdminResourcesTest] Policy left active";
    }
};

TEST_F(AdminResourcesTest, AdminFolderIsHiddenFromUser) {
    const auto folder = createFolderAsAdmin(ROOT_FOLDER_ID);
    const auto file = createSmallFileAsAdmin(folder.id);

    EXPECT_EQ(file.owned_by, session().adminClient().principal());
    EXPECT_THROW(session().userClient().getFolder(folder.id), remote::ApiError);
}

TEST_F(AdminResourcesTest, RetentionPolicyOnFolder) {
    const auto folder = createFolderAsAdmin(ROOT_FOLDER_ID);
    const auto policy = createRetentionPolicy(folder.id);

    EXPECT_EQ(LeakCheckEnvironment::backend().activePolicyCount(), 1u);
    EXPECT_EQ(session().adminClient().getRetentionPolicy(policy.id).status, PolicyStatus::Active);

    // policy is disposed before the folder it was assigned to
    EXPECT_EQ(controller().pendingResources(Scope::Test), (std::vector<ResourceId>{folder.id, policy.id}));
}

TEST_F(AdminResourcesTest, EnterpriseRetentionPolicy) {
    const auto policy = createRetentionPolicy();
    EXPECT_TRUE(policy.name.starts_with("policy - "));
    EXPECT_EQ(LeakCheckEnvironment::backend().activePolicyCount(), 1u);
}

class UserResourcesTest : public harness::IntegrationTestBase {};

TEST_F(UserResourcesTest, DeleteFileIsImmediate) {
    const auto file = session().userClient().uploadFile(FileRequest{.name = uniqueTestName()}, {7, 7, 7});

    deleteFile(file.id);
    EXPECT_FALSE(LeakCheckEnvironment::backend().hasItem(file.id));
    EXPECT_EQ(controller().pending(Scope::Test), 0u);
}

TEST_F(UserResourcesTest, UniqueTestNameCarriesTestName) {
    const auto a = uniqueTestName();
    EXPECT_TRUE(a.starts_with("UniqueTestNameCarriesTestName - "));
    EXPECT_NE(a, uniqueTestName());
}

TEST_F(UserResourcesTest, BothFixtureVersionsUpload) {
    EXPECT_NE(fs::file_size(smallFilePath()), fs::file_size(smallFileV2Path()));

    const auto v1 = createSmallFile();
    EXPECT_EQ(v1.size, fs::file_size(smallFilePath()));
    EXPECT_TRUE(resources().readFixture("smalltestV2.pdf").starts_with("%PDF-"));
}

TEST_F(UserResourcesTest, FailedCreationIsNotTracked) {
    const auto folder = createFolder();
    EXPECT_THROW(createFolder("no-such-folder"), remote::ApiError);
    EXPECT_EQ(controller().pendingResources(Scope::Test), std::vector<ResourceId>{folder.id});
}
