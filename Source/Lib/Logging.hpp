/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/common.h>

#include <spdlog/sinks/dist_sink.h>

#include "StdLib.hpp"

namespace Log {
    using SpdLogger = spdlog::logger;
    using SpdSink = spdlog::sinks::sink;
    using Level = spdlog::level::level_enum;
    using namespace StdLib;

    class ILoggingRegistryManagement {
    public:
        virtual ~ILoggingRegistryManagement() = default;
        virtual void RegisterModule(const String &moduleName, Level level) = 0;
        virtual SharedPtr<SpdLogger> Logger(const String &moduleName) = 0;
        virtual void AddLogSink(SharedPtr<SpdSink> sink) = 0;
    };

    /** Hands out loggers which never emit anything. Used when nobody has configured logging. */
    class NullLoggerRegistryManagement : public ILoggingRegistryManagement {
    public:
        ~NullLoggerRegistryManagement() override = default;

        void RegisterModule([[maybe_unused]] const String &, [[maybe_unused]] Level) override {
        }

        SharedPtr<SpdLogger> Logger(const String &moduleName) override {
            // A logger without sinks drops every message
            auto logger = std::make_shared<SpdLogger>(moduleName);
            logger->set_level(spdlog::level::off);
            return logger;
        }

        void AddLogSink([[maybe_unused]] SharedPtr<SpdSink>) override { }
    };

    class LoggerRegistry : public ILoggingRegistryManagement {
    public:
        explicit LoggerRegistry(spdlog::sinks_init_list sinksList) : mSinksList(std::make_shared<spdlog::sinks::dist_sink_mt>()) {
            mSinksList->set_sinks(std::move(sinksList));
        }

        ~LoggerRegistry() override = default;

        void RegisterModule(const String &moduleName, Level level) override {
            auto logger = std::make_shared<SpdLogger>(moduleName, mSinksList);
            logger->set_level(level);
            logger->flush_on(spdlog::level::err);
            mLoggerByModuleName[moduleName] = logger;
        }

        SharedPtr<SpdLogger> Logger(const String &moduleName) override {
            auto loggerIt = mLoggerByModuleName.find(moduleName);
            if (loggerIt == mLoggerByModuleName.end()) {
                // Unregistered module gets its own logger with logging turned off
                auto logger = std::make_shared<SpdLogger>(moduleName);
                logger->set_level(spdlog::level::off);
                loggerIt = mLoggerByModuleName.emplace(moduleName, logger).first;
            }

            return loggerIt->second;
        }

        void AddLogSink(spdlog::sink_ptr sink) override {
            mSinksList->add_sink(sink);
        }

    private:
        Map<String, SharedPtr<SpdLogger>> mLoggerByModuleName;
        SharedPtr<spdlog::sinks::dist_sink_mt> mSinksList; // dist_sink lets sinks be added after loggers are created
    };
} // namespace Log
