/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "FileStorage.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace {
using namespace StdLib;
namespace fs = std::filesystem;

class FileStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        mDirectory = fs::temp_directory_path() / (String("treepatch_") + testInfo->name());
        fs::remove_all(mDirectory);
        ASSERT_TRUE(fs::create_directories(mDirectory));
    }

    void TearDown() override {
        std::error_code errCode;
        fs::remove_all(mDirectory, errCode);
    }

    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
    fs::path mDirectory;
};

TEST_F(FileStorageTest, SavedDataCanBeLoaded) {
    const auto fileName = (mDirectory / "document.json").string();
    Storage::FileStorage storage(fileName, mModuleRegistry);
    const auto data = fToByteStream("{\"a\": [1, 2, 3]}\n");
    ASSERT_TRUE(storage.SaveData(data));

    auto loaded = storage.LoadData();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value(), data);
    EXPECT_FALSE(fs::exists(fileName + ".tmp"));
}

TEST_F(FileStorageTest, SaveReplacesExistingContent) {
    const auto fileName = (mDirectory / "document.xml").string();
    Storage::FileStorage storage(fileName, mModuleRegistry);
    ASSERT_TRUE(storage.SaveData(fToByteStream("<Root>long original content</Root>")));
    ASSERT_TRUE(storage.SaveData(fToByteStream("<Root/>")));

    auto loaded = storage.LoadData();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(fToString(loaded.value()), "<Root/>");
}

TEST_F(FileStorageTest, LoadMissingFileFails) {
    Storage::FileStorage storage((mDirectory / "missing.json").string(), mModuleRegistry);
    EXPECT_FALSE(storage.LoadData().has_value());
}

TEST_F(FileStorageTest, SaveIntoMissingDirectoryFails) {
    Storage::FileStorage storage((mDirectory / "no" / "such" / "dir.json").string(), mModuleRegistry);
    EXPECT_FALSE(storage.SaveData(fToByteStream("{}")));
}

TEST_F(FileStorageTest, KeepsUri) {
    Storage::FileStorage storage("some/file.json", mModuleRegistry);
    EXPECT_EQ(storage.URI(), "some/file.json");
}

} // namespace
