/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IDataStorage.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"

#include <filesystem>
#include <iterator>

namespace Storage {
class FileStorage : public IDataStorage {
public:
    FileStorage(const String& fileName, const SharedPtr<ModuleRegistry>& moduleRegistry)
      : IDataStorage(fileName), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::DATA_STORAGE)) {}
    ~FileStorage() override = default;

    /** LoadData - Read the whole file
     * @return File content or empty value if the file cannot be read
     */
    Optional<ByteStream> LoadData() override {
        IFStream file(mURI, std::ios_base::binary);
        if (!file.is_open()) {
            mLog->error("Failed to open file '{}'", mURI);
            return {};
        }

        ByteStream data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            mLog->error("Failed to read file '{}'", mURI);
            return {};
        }

        mLog->debug("Loaded {} byte(s) from file '{}'", data.size(), mURI);
        return data;
    }

    /** SaveData - Replace the file content
     * Data goes to a temporary file first which is then renamed onto the target, so readers never see
     * a half written file.
     */
    bool SaveData(const ByteStream& data) override {
        const std::filesystem::path targetPath(mURI);
        const std::filesystem::path tmpPath(mURI + ".tmp");
        {
            OFStream tmpFile(tmpPath, std::ios_base::binary | std::ios_base::trunc);
            if (!tmpFile.is_open()) {
                mLog->error("Failed to open file '{}' to save data", tmpPath.string());
                return false;
            }

            tmpFile.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            tmpFile.flush();
            if (!tmpFile.good()) {
                mLog->error("Failed to save data to file '{}'", tmpPath.string());
                tmpFile.close();
                std::error_code errCode = {};
                std::filesystem::remove(tmpPath, errCode);
                return false;
            }
        }

        std::error_code errCode = {};
        std::filesystem::rename(tmpPath, targetPath, errCode);
        if (errCode) {
            mLog->error("Failed to move temporary file '{}' onto '{}'. Error: {}",
                tmpPath.string(), mURI, errCode.message());
            std::error_code removeErrCode = {};
            std::filesystem::remove(tmpPath, removeErrCode);
            return false;
        }

        mLog->debug("Saved {} byte(s) into file '{}'", data.size(), mURI);
        return true;
    }

protected:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class FileStorage
} // namespace Storage
