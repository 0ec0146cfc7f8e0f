#include "LeakCheckEnvironment.hpp"
#include "harness/IntegrationTestBase.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "lifecycle/SessionState.hpp"
#include "resources/Resources.hpp"
#include "remote/Client.hpp"

#include <vector>

using namespace qm;
using namespace qm::commands;
using namespace qm::remote::model;
using namespace qm::test;

// One folder for the whole suite; every test drops files into it.
class FolderScopesTest : public harness::IntegrationTestBase {
public:
    static void SetUpTestSuite() {
        IntegrationTestBase::SetUpTestSuite();
        sharedFolder_ = createFolder(ROOT_FOLDER_ID, Scope::Class);
    }

    static void TearDownTestSuite() {
        IntegrationTestBase::TearDownTestSuite();
        EXPECT_FALSE(LeakCheckEnvironment::backend().hasItem(sharedFolder_.id));
    }

protected:
    static inline Folder sharedFolder_{};

    // Test-scoped items a test made; gone once its scope closes, shared folder untouched.
    std::vector<std::string> created_;

    void TearDown() override {
        IntegrationTestBase::TearDown();
        for (const auto& id : created_)
            EXPECT_FALSE(LeakCheckEnvironment::backend().hasItem(id)) << "[FolderScopesTest] " << id << " outlived its test";
        EXPECT_TRUE(LeakCheckEnvironment::backend().hasItem(sharedFolder_.id));
    }
};

TEST_F(FolderScopesTest, SharedFolderExistsForEveryTest) {
    EXPECT_TRUE(LeakCheckEnvironment::backend().hasItem(sharedFolder_.id));
    EXPECT_EQ(sharedFolder_.owned_by, session().userId());
    EXPECT_EQ(controller().pending(Scope::Class), 1u);
    EXPECT_EQ(controller().pending(Scope::Test), 0u);
}

TEST_F(FolderScopesTest, FileInSharedFolder) {
    const auto file = createSmallFile(sharedFolder_.id);
    created_.push_back(file.id);

    EXPECT_EQ(file.parent_id, sharedFolder_.id);
    EXPECT_EQ(session().userClient().getFile(file.id).size, file.size);
}

TEST_F(FolderScopesTest, NestedFoldersAndFiles) {
    const auto outer = createFolder(sharedFolder_.id);
    const auto inner = createFolder(outer.id);
    const auto v1 = createSmallFile(inner.id);
    const auto v2 = resources().createFile(std::vector<uint8_t>(2048, 0x5a), inner.id);
    created_ = {outer.id, inner.id, v1.id, v2.id};

    EXPECT_EQ(controller().pendingResources(Scope::Test), created_);
    EXPECT_EQ(v2.size, 2048u);
}
