/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonPatchReader.hpp"

#include "Lib/Utils.hpp"
#include "Modules.hpp"

#include <fmt/core.h>

namespace Json {
using Error = ::Patch::Error;
using ErrorKind = ::Patch::Error::Kind;

namespace {
const nlohmann::json PATCH_SCHEMA = R"patch({
    "title": "List of patch operations",
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "array",
    "items": {
        "type": "object",
        "required": [ "op", "path" ],
        "properties": {
            "op": {
                "description": "The operation to perform.",
                "type": "string"
            },
            "path": {
                "description": "A JSON Pointer to the target location.",
                "type": "string"
            },
            "value": {
                "description": "The value to add or replace."
            }
        }
    }
})patch"_json;

// Property names of operations are case insensitive, so they are folded before validation
JSON fNormalizeOperations(const JSON& jPatch) {
    if (!jPatch.is_array()) {
        return jPatch;
    }

    auto jNormalized = JSON::array();
    for (const auto& jOperation : jPatch) {
        if (!jOperation.is_object()) {
            jNormalized.push_back(jOperation);
            continue;
        }

        auto jNormalizedOperation = JSON::object();
        for (const auto& [key, value] : jOperation.items()) {
            jNormalizedOperation[Utils::fToLower(key)] = value;
        }

        jNormalized.push_back(std::move(jNormalizedOperation));
    }

    return jNormalized;
}

Optional<::Patch::OpKind> fParseOperationName(const String& name) {
    auto lowered = Utils::fToLower(name);
    if (lowered == Keyword::Operation::ADD) {
        return ::Patch::OpKind::Add;
    }

    if (lowered == Keyword::Operation::REMOVE) {
        return ::Patch::OpKind::Remove;
    }

    if (lowered == Keyword::Operation::REPLACE) {
        return ::Patch::OpKind::Replace;
    }

    return {};
}
} // namespace

PatchReader::PatchReader(const SharedPtr<ModuleRegistry>& moduleRegistry)
  : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::PATCH_READER)), mValidator(PATCH_SCHEMA) {
}

::Patch::Result<JSON> PatchReader::ParseDocument(const ByteStream& data) const {
    try {
        auto jDocument = JSON::parse(data);
        mLog->trace("Successfully parsed JSON document:\n{}", jDocument.dump(DEFAULT_OUTPUT_INDENT));
        return std::move(jDocument);
    }
    catch (const JSON::exception& ex) {
        mLog->error("Failed to parse JSON document. Error: {}", ex.what());
        return Error(ErrorKind::MalformedDocument, fmt::format("Failed to parse JSON document. Error: {}", ex.what()));
    }
}

ByteStream PatchReader::SerializeDocument(const JSON& document) const {
    return fToByteStream(document.dump(DEFAULT_OUTPUT_INDENT));
}

::Patch::Result<Vector<PatchOperation>> PatchReader::ParseOperations(const ByteStream& data) const {
    JSON jPatch;
    try {
        jPatch = fNormalizeOperations(JSON::parse(data));
    }
    catch (const JSON::exception& ex) {
        mLog->error("Failed to parse JSON patch. Error: {}", ex.what());
        return Error(ErrorKind::MalformedPatch, fmt::format("Failed to parse JSON patch. Error: {}", ex.what()));
    }

    ErrorHandler err;
    mValidator.validate(nlohmann::json(jPatch), err);
    if (err) {
        mLog->error("JSON patch does not match the expected shape. Error: {}", err.MsgError());
        return Error(ErrorKind::MalformedPatch, fmt::format("JSON patch does not match the expected shape. Error: {}", err.MsgError()));
    }

    Vector<PatchOperation> operations;
    operations.reserve(jPatch.size());
    for (SizeT i = 0; i < jPatch.size(); ++i) {
        const auto& jOperation = jPatch[i];
        const auto name = jOperation[Keyword::Field::OPERATION].get<String>();
        const auto path = jOperation[Keyword::Field::PATH].get<String>();
        auto kind = fParseOperationName(name);
        if (!kind.has_value()) {
            mLog->error("Unsupported operation '{}' at index {}", name, i);
            Error error(ErrorKind::UnknownOperation, fmt::format("Unsupported operation: {}", name), path);
            error.SetOperationIndex(i);
            return error;
        }

        Optional<JSON> value;
        auto valueIt = jOperation.find(Keyword::Field::VALUE);
        if (valueIt != jOperation.end()) {
            value = valueIt.value();
        }

        operations.push_back(PatchOperation { kind.value(), path, std::move(value) });
    }

    mLog->trace("Successfully read {} JSON patch operation(s)", operations.size());
    return std::move(operations);
}

} // namespace Json
