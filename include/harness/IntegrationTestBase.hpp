#pragma once

#include "commands/Command.hpp"
#include "remote/model/File.hpp"
#include "remote/model/Folder.hpp"
#include "remote/model/RetentionPolicy.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace qm::lifecycle { class LifecycleController; class SessionState; }
namespace qm::resources { class Resources; }

namespace qm::harness {

// Base fixture: one class scope per suite, one test scope per test.
// Suites that create class-scoped resources override SetUpTestSuite() and call
// IntegrationTestBase::SetUpTestSuite() first.
class IntegrationTestBase : public ::testing::Test {
public:
    static void SetUpTestSuite();
    static void TearDownTestSuite();

protected:
    void SetUp() override;
    void TearDown() override;

    static lifecycle::LifecycleController& controller();
    static resources::Resources& resources();
    static const lifecycle::SessionState& session();

    static remote::model::File createSmallFile(const std::string& parentId = remote::model::ROOT_FOLDER_ID,
                                               commands::Scope scope = commands::Scope::Test,
                                               commands::AccessLevel accessLevel = commands::AccessLevel::User);
    static remote::model::File createSmallFileAsAdmin(const std::string& parentId);
    static void deleteFile(const std::string& fileId);

    static remote::model::Folder createFolder(const std::string& parentId = remote::model::ROOT_FOLDER_ID,
                                              commands::Scope scope = commands::Scope::Test,
                                              commands::AccessLevel accessLevel = commands::AccessLevel::User);
    static remote::model::Folder createFolderAsAdmin(const std::string& parentId);

    static remote::model::RetentionPolicy createRetentionPolicy(const std::string& folderId = remote::model::ROOT_FOLDER_ID,
                                                                commands::Scope scope = commands::Scope::Test);

    static std::filesystem::path smallFilePath();
    static std::filesystem::path smallFileV2Path();

    // "<TestName> - <uuid>"
    static std::string uniqueTestName();
};

}
