#include "harness/IntegrationTestBase.hpp"
#include "harness/IntegrationEnvironment.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "resources/Resources.hpp"
#include "util/naming.hpp"

using namespace qm::harness;
using namespace qm::commands;
using namespace qm::remote::model;

void IntegrationTestBase::SetUpTestSuite() { controller().startClass(); }

void IntegrationTestBase::TearDownTestSuite() { controller().endClass(); }

void IntegrationTestBase::SetUp() { controller().startTest(); }

void IntegrationTestBase::TearDown() { controller().endTest(); }

qm::lifecycle::LifecycleController& IntegrationTestBase::controller() {
    return IntegrationEnvironment::instance().controller();
}

qm::resources::Resources& IntegrationTestBase::resources() {
    return IntegrationEnvironment::instance().resources();
}

const qm::lifecycle::SessionState& IntegrationTestBase::session() { return controller().session(); }

File IntegrationTestBase::createSmallFile(const std::string& parentId, const Scope scope, const AccessLevel accessLevel) {
    return resources().createSmallFile(parentId, scope, accessLevel);
}

File IntegrationTestBase::createSmallFileAsAdmin(const std::string& parentId) {
    return resources().createSmallFileAsAdmin(parentId);
}

void IntegrationTestBase::deleteFile(const std::string& fileId) { resources().deleteFile(fileId); }

Folder IntegrationTestBase::createFolder(const std::string& parentId, const Scope scope, const AccessLevel accessLevel) {
    return resources().createFolder(parentId, scope, accessLevel);
}

Folder IntegrationTestBase::createFolderAsAdmin(const std::string& parentId) {
    return resources().createFolderAsAdmin(parentId);
}

RetentionPolicy IntegrationTestBase::createRetentionPolicy(const std::string& folderId, const Scope scope) {
    return resources().createRetentionPolicy(folderId, scope);
}

std::filesystem::path IntegrationTestBase::smallFilePath() { return resources().smallFilePath(); }

std::filesystem::path IntegrationTestBase::smallFileV2Path() { return resources().smallFileV2Path(); }

std::string IntegrationTestBase::uniqueTestName() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return util::uniqueName(info ? info->name() : "test");
}
