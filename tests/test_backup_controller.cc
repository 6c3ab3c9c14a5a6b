// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include <gtest/gtest.h>
#include "../src/core/controllers/BackupController.h"
#include "../src/core/repositories/IdentityRepository.h"
#include "TestDoubles.h"
#include <filesystem>
#include <fstream>

using namespace Sentinel;
using Sentinel::Testing::MemoryObserver;
using Sentinel::Testing::MemoryPersistence;
using Sentinel::Testing::make_record;

// ============================================================================
// Test Fixture
// ============================================================================

class BackupControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo = std::make_unique<IdentityRepository>(&persistence);
        controller = std::make_unique<BackupController>(repo.get(), &observer);

        ASSERT_TRUE(repo->add(make_record("keep-1", "Existing One", {"MAIN"})).has_value());
        ASSERT_TRUE(repo->add(make_record("keep-2", "Existing Two")).has_value());

        google::protobuf::Value entry;
        entry.set_string_value("observed");
        observer.dataset.push_back(entry);

        test_dir = std::filesystem::temp_directory_path() / "sentinel_test_backup_controller";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::vector<std::string> stored_ids() const {
        std::vector<std::string> ids;
        for (const auto& record : repo->get_all()) {
            ids.push_back(record.id());
        }
        return ids;
    }

    MemoryPersistence persistence;
    MemoryObserver observer;
    std::unique_ptr<IdentityRepository> repo;
    std::unique_ptr<BackupController> controller;
    std::filesystem::path test_dir;
};

TEST_F(BackupControllerTest, Constructor_NullArguments_Throw) {
    EXPECT_THROW(BackupController(nullptr, &observer), std::invalid_argument);
    EXPECT_THROW(BackupController(repo.get(), nullptr), std::invalid_argument);
}

// ============================================================================
// Import
// ============================================================================

TEST_F(BackupControllerTest, ImportCorrupt_LeavesStateUntouched) {
    const int saves_before = persistence.save_calls;

    auto result = controller->import_text("definitely { not json", true);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::CorruptBackup);
    EXPECT_EQ(stored_ids(), (std::vector<std::string>{"keep-1", "keep-2"}));
    EXPECT_EQ(persistence.save_calls, saves_before);
    EXPECT_EQ(observer.restore_calls, 0);
}

TEST_F(BackupControllerTest, ImportWithoutConfirmation_NothingChanges) {
    auto result = controller->import_text(R"([{"id":"new","name":"New"}])", false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::ConfirmationRequired);
    EXPECT_EQ(repo->count(), 2u);
}

TEST_F(BackupControllerTest, ImportCorruptWithoutConfirmation_ReportsCorrupt) {
    auto result = controller->import_text("<xml/>", false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::CorruptBackup);
}

TEST_F(BackupControllerTest, ImportLegacyList_ReplacesWholesale) {
    auto result = controller->import_text(
        R"([{"id":"n1","name":"New One","secret":"AAAA"},{"id":"n2","name":"New Two"}])", true);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format, BackupCodec::BackupFormat::LegacyList);
    EXPECT_EQ(result->identities, 2u);
    EXPECT_EQ(result->observer_records, 0u);
    EXPECT_EQ(stored_ids(), (std::vector<std::string>{"n1", "n2"}));
    ASSERT_EQ(persistence.stored.size(), 2u);
    EXPECT_EQ(persistence.stored[0].vault_size(), 10);
}

TEST_F(BackupControllerTest, ImportEmptyObserverData_DoesNotRestore) {
    auto result = controller->import_text(R"({"version":2,"identities":[],"observerData":[]})", true);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(repo->count(), 0u);
    EXPECT_EQ(observer.restore_calls, 0);
    EXPECT_EQ(observer.dataset.size(), 1u);
}

TEST_F(BackupControllerTest, ImportObserverData_ForwardedToService) {
    auto result = controller->import_text(
        R"({"version":2,"identities":[{"name":"X"}],"observerData":[{"a":1},{"b":2},{"c":3}]})", true);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->observer_records, 3u);
    EXPECT_EQ(observer.restore_calls, 1);
    EXPECT_EQ(observer.dataset.size(), 3u);
}

TEST_F(BackupControllerTest, ImportSkippedEntries_Reported) {
    auto result = controller->import_text(R"([{"name":"ok"}, 1, 2])", true);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->identities, 1u);
    EXPECT_EQ(result->skipped_entries, 2u);
}

TEST_F(BackupControllerTest, ImportNewerVersionNumber_ReplacesStore) {
    auto result = controller->import_text(R"({"version":99,"identities":[{"id":"later","name":"L"}]})", true);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format, BackupCodec::BackupFormat::Envelope);
    EXPECT_EQ(stored_ids(), (std::vector<std::string>{"later"}));
}

TEST_F(BackupControllerTest, Preview_DoesNotTouchState) {
    auto preview = controller->preview(R"([{"name":"Preview"}])");
    ASSERT_TRUE(preview.has_value());
    EXPECT_EQ(preview->identities.size(), 1u);
    EXPECT_EQ(repo->count(), 2u);
}

// ============================================================================
// Export
// ============================================================================

TEST_F(BackupControllerTest, ExportThenImport_RoundTripsSystem) {
    auto text = controller->export_text();
    ASSERT_TRUE(text.has_value());

    ASSERT_TRUE(repo->replace_all({}).has_value());
    observer.dataset.clear();

    auto result = controller->import_text(*text, true);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(stored_ids(), (std::vector<std::string>{"keep-1", "keep-2"}));
    EXPECT_EQ(repo->get_by_id("keep-1")->tags(0), "MAIN");
    ASSERT_EQ(observer.dataset.size(), 1u);
    EXPECT_EQ(observer.dataset[0].string_value(), "observed");
}

TEST_F(BackupControllerTest, ExportToDirectory_UsesDefaultFilename) {
    auto written = controller->export_to_file(test_dir.string());

    ASSERT_TRUE(written.has_value());
    const std::filesystem::path path(*written);
    EXPECT_EQ(path.parent_path(), test_dir);
    EXPECT_TRUE(path.filename().string().starts_with("nexus_global_backup_"));
    EXPECT_EQ(path.extension(), ".nexus");
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(BackupControllerTest, ExportToFileThenImportFile) {
    const auto path = (test_dir / "manual.nexus").string();
    ASSERT_TRUE(controller->export_to_file(path).has_value());

    ASSERT_TRUE(repo->remove("keep-2").has_value());
    auto result = controller->import_file(path, true);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(repo->count(), 2u);
}

TEST_F(BackupControllerTest, ImportMissingFile_FileNotFound) {
    auto result = controller->import_file((test_dir / "missing.nexus").string(), true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SentinelError::FileNotFound);
}
