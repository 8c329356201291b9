/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "FileStorage.hpp"
#include "JsonPatchReader.hpp"
#include "Modules.hpp"
#include "PatchApi.hpp"
#include "XmlPatchReader.hpp"

#include <args.hxx>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>

namespace Std = StdLib;

namespace {
struct PatchFiles {
    Std::String Document;
    Std::String Patch;
    Std::String Output;
};

Std::Optional<ByteStream> fLoadFile(const Std::String& fileName, const Std::SharedPtr<ModuleRegistry>& moduleRegistry) {
    Storage::FileStorage storage(fileName, moduleRegistry);
    auto data = storage.LoadData();
    if (!data.has_value()) {
        spdlog::error("Failed to load file '{}'", storage.URI());
    }

    return data;
}

bool fSaveFile(const Std::String& fileName, const ByteStream& data, const Std::SharedPtr<ModuleRegistry>& moduleRegistry) {
    Storage::FileStorage storage(fileName, moduleRegistry);
    if (!storage.SaveData(data)) {
        spdlog::error("Failed to save file '{}'", storage.URI());
        return false;
    }

    return true;
}

bool fRunJsonPatch(const PatchFiles& files, const Std::SharedPtr<ModuleRegistry>& moduleRegistry) {
    spdlog::info("== JSON Patch ==");
    auto documentData = fLoadFile(files.Document, moduleRegistry);
    auto patchData = fLoadFile(files.Patch, moduleRegistry);
    if (!documentData.has_value() || !patchData.has_value()) {
        return false;
    }

    Json::PatchReader reader(moduleRegistry);
    auto document = reader.ParseDocument(documentData.value());
    if (!document) {
        spdlog::error("Failed to read JSON document '{}'. Error: {}", files.Document, document.GetError().Describe());
        return false;
    }

    auto operations = reader.ParseOperations(patchData.value());
    if (!operations) {
        spdlog::error("Failed to read JSON patch '{}'. Error: {}", files.Patch, operations.GetError().Describe());
        return false;
    }

    auto result = Patch::ApplyJsonPatch(std::move(document).Value(), operations.Value(), moduleRegistry);
    if (!result) {
        spdlog::error("Failed to apply JSON patch '{}'. No output is written. Error: {}", files.Patch, result.GetError().Describe());
        return false;
    }

    if (!fSaveFile(files.Output, reader.SerializeDocument(result.Value()), moduleRegistry)) {
        return false;
    }

    spdlog::info("JSON Patch successfully applied. Output: {}", files.Output);
    return true;
}

bool fRunXmlPatch(const PatchFiles& files, const Std::SharedPtr<ModuleRegistry>& moduleRegistry) {
    spdlog::info("== XML Patch ==");
    auto documentData = fLoadFile(files.Document, moduleRegistry);
    auto patchData = fLoadFile(files.Patch, moduleRegistry);
    if (!documentData.has_value() || !patchData.has_value()) {
        return false;
    }

    Xml::PatchReader reader(moduleRegistry);
    auto document = reader.ParseDocument(documentData.value());
    if (!document) {
        spdlog::error("Failed to read XML document '{}'. Error: {}", files.Document, document.GetError().Describe());
        return false;
    }

    auto operations = reader.ParseOperations(patchData.value());
    if (!operations) {
        spdlog::error("Failed to read XML patch '{}'. Error: {}", files.Patch, operations.GetError().Describe());
        return false;
    }

    auto result = Patch::ApplyXmlPatch(std::move(document).Value(), operations.Value(), moduleRegistry);
    if (!result) {
        spdlog::error("Failed to apply XML patch '{}'. No output is written. Error: {}", files.Patch, result.GetError().Describe());
        return false;
    }

    auto outputData = reader.SerializeDocument(*result.Value());
    if (outputData.empty() || !fSaveFile(files.Output, outputData, moduleRegistry)) {
        return false;
    }

    spdlog::info("XML patch successfully applied. Output: {}", files.Output);
    return true;
}
} // namespace

int main(const int argc, const char* argv[]) {
    args::ArgumentParser argParser("Applies JSON Pointer and XPath based patches to JSON and XML documents");
    args::HelpFlag help(argParser, "HELP", "Show this help menu", {'h', "help"});
    args::ValueFlag<Std::String> jsonDocument(argParser, "FILE", "The JSON document to patch", { "json-document" });
    args::ValueFlag<Std::String> jsonPatch(argParser, "FILE", "The JSON patch (list of operations)", { "json-patch" });
    args::ValueFlag<Std::String> jsonOutput(argParser, "FILE", "Where to write the patched JSON document", { "json-output" });
    args::ValueFlag<Std::String> xmlDocument(argParser, "FILE", "The XML document to patch", { "xml-document" });
    args::ValueFlag<Std::String> xmlPatch(argParser, "FILE", "The XML patch", { "xml-patch" });
    args::ValueFlag<Std::String> xmlOutput(argParser, "FILE", "Where to write the patched XML document", { "xml-output" });
    args::ValueFlag<Std::String> logLevel(argParser, "LEVEL", "Log level: trace, debug, info, warning, error, critical or off", { 'l', "log-level" }, "info");
    args::ValueFlag<Std::String> logFile(argParser, "FILE", "Additionally write logs to this file", { "log-file" });
    try {
        argParser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << argParser;
        ::exit(EXIT_SUCCESS);
    }
    catch (const args::ParseError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }
    catch (const args::ValidationError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }

    const auto level = spdlog::level::from_str(args::get(logLevel));
    if ((level == spdlog::level::off) && (args::get(logLevel) != "off")) {
        spdlog::error("Unknown log level '{}'", args::get(logLevel));
        ::exit(EXIT_FAILURE);
    }

    const bool anyJsonFlag = jsonDocument || jsonPatch || jsonOutput;
    const bool allJsonFlags = jsonDocument && jsonPatch && jsonOutput;
    const bool anyXmlFlag = xmlDocument || xmlPatch || xmlOutput;
    const bool allXmlFlags = xmlDocument && xmlPatch && xmlOutput;
    if ((!anyJsonFlag && !anyXmlFlag) || (anyJsonFlag && !allJsonFlags) || (anyXmlFlag && !allXmlFlags)) {
        spdlog::error("Expected all of --json-document, --json-patch and --json-output and/or all of --xml-document, --xml-patch and --xml-output");
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }

    auto consoleLogSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleLogSink->set_level(level);
    consoleLogSink->set_pattern("%+");

    auto loggerRegistry = std::make_shared<Log::LoggerRegistry>(spdlog::sinks_init_list{consoleLogSink});
    if (logFile) {
        auto fileLogSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(args::get(logFile), true);
        fileLogSink->set_level(level);
        fileLogSink->set_pattern("%+");
        loggerRegistry->AddLogSink(fileLogSink);
    }

    loggerRegistry->RegisterModule(Module::Name::DATA_STORAGE, level);
    loggerRegistry->RegisterModule(Module::Name::JSON_ENGINE, level);
    loggerRegistry->RegisterModule(Module::Name::PATCH_DRIVER, level);
    loggerRegistry->RegisterModule(Module::Name::PATCH_READER, level);
    loggerRegistry->RegisterModule(Module::Name::XML_ENGINE, level);
    spdlog::set_level(level);

    auto moduleRegistry = std::make_shared<ModuleRegistry>();
    moduleRegistry->SetLoggerRegistry(loggerRegistry);

    bool succeeded = true;
    if (allJsonFlags) {
        succeeded = fRunJsonPatch({ args::get(jsonDocument), args::get(jsonPatch), args::get(jsonOutput) }, moduleRegistry);
    }

    if (allXmlFlags && succeeded) {
        succeeded = fRunXmlPatch({ args::get(xmlDocument), args::get(xmlPatch), args::get(xmlOutput) }, moduleRegistry);
    }

    spdlog::info("Done");
    ::exit(succeeded ? EXIT_SUCCESS : EXIT_FAILURE);
}
