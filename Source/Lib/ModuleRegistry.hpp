/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Logging.hpp"
#include "StdLib.hpp"

/** Shared services handed to every component of the patch pipeline */
class ModuleRegistry {
public:
    ModuleRegistry()
      : mLoggerRegistry { std::make_shared<Log::NullLoggerRegistryManagement>() } {
        // Logging stays silent until a real registry is set
    }

    inline const StdLib::SharedPtr<Log::ILoggingRegistryManagement> LoggerRegistry() const { return mLoggerRegistry; }
    inline void SetLoggerRegistry(StdLib::SharedPtr<Log::ILoggingRegistryManagement> loggerRegistry) { mLoggerRegistry = std::move(loggerRegistry); }

    inline StdLib::SharedPtr<Log::SpdLogger> Logger(const StdLib::String& moduleName) const {
        return mLoggerRegistry->Logger(moduleName);
    }

private:
    StdLib::SharedPtr<Log::ILoggingRegistryManagement> mLoggerRegistry;
};
