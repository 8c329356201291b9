/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonPatchEngine.hpp"

#include "Lib/Utils.hpp"
#include "Modules.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace Json {
using Error = ::Patch::Error;
using ErrorKind = ::Patch::Error::Kind;
using OpKind = ::Patch::OpKind;

namespace {
Optional<Error> fMissingValue(const PatchOperation& operation) {
    return Error(ErrorKind::MissingValue,
        fmt::format("The '{}' operation requires a value", ::Patch::fOpKindName(operation.Kind)), operation.Path);
}

Optional<Error> fUnsupportedTarget(const JSON& parent, const PatchOperation& operation) {
    return Error(ErrorKind::UnsupportedTarget,
        fmt::format("The '{}' operation can only be applied to objects or arrays, found {}",
            ::Patch::fOpKindName(operation.Kind), parent.type_name()), operation.Path);
}

// Integers which are no valid index (negative or too big) point outside of the array
Optional<Error> fInvalidIndex(const JSON& parent, const String& token, const PatchOperation& operation) {
    if (Utils::fIsIntegerToken(token)) {
        return Error(ErrorKind::IndexOutOfRange,
            fmt::format("Index {} is out of range for array of size {}", token, parent.size()), operation.Path);
    }

    return Error(ErrorKind::InvalidPath, fmt::format("Invalid array index '{}'", token), operation.Path);
}

/** Parse the token addressing an existing array element. The append marker names no element. */
Optional<Error> fParseExistingIndex(const JSON& parent, const String& token, const PatchOperation& operation, SizeT& index) {
    if (token == Keyword::APPEND_MARKER) {
        return Error(ErrorKind::IndexOutOfRange,
            fmt::format("Index '{}' does not address an existing element", token), operation.Path);
    }

    auto parsedIndex = Utils::fParseArrayIndex(token);
    if (!parsedIndex.has_value()) {
        return fInvalidIndex(parent, token, operation);
    }

    if (parsedIndex.value() >= parent.size()) {
        return Error(ErrorKind::IndexOutOfRange,
            fmt::format("Index {} is out of range for array of size {}", parsedIndex.value(), parent.size()), operation.Path);
    }

    index = parsedIndex.value();
    return {};
}
} // namespace

PatchEngine::PatchEngine(const SharedPtr<ModuleRegistry>& moduleRegistry)
  : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::JSON_ENGINE)) {
}

String PatchEngine::Describe(const PatchOperation& operation) const {
    return fmt::format("{} '{}'", ::Patch::fOpKindName(operation.Kind), operation.Path);
}

::Patch::Result<ResolvedTarget> PatchEngine::Resolve(JSON& document, const String& pointer) const {
    if (pointer.empty()) {
        return Error(ErrorKind::InvalidPath, "Path cannot be empty", pointer);
    }

    Vector<String> tokens;
    try {
        // json_pointer validates the syntax and unescapes "~1" and "~0"
        for (auto jPointer = JSON::json_pointer(pointer); !jPointer.empty(); jPointer.pop_back()) {
            tokens.push_back(jPointer.back());
        }
    }
    catch (const JSON::exception& ex) {
        return Error(ErrorKind::InvalidPath, fmt::format("Malformed JSON Pointer. Error: {}", ex.what()), pointer);
    }

    std::reverse(tokens.begin(), tokens.end());

    JSON* current = &document;
    for (SizeT i = 0; i + 1 < tokens.size(); ++i) {
        const auto& token = tokens[i];
        switch (current->type()) {
            case JSON::value_t::object: {
                auto childIt = current->find(token);
                if (childIt == current->end()) {
                    return Error(ErrorKind::PathResolution, fmt::format("Key '{}' does not exist", token), pointer);
                }

                current = &childIt.value();
                break;
            }
            case JSON::value_t::array: {
                auto index = Utils::fParseArrayIndex(token);
                if (!index.has_value() || (index.value() >= current->size())) {
                    return Error(ErrorKind::PathResolution,
                        fmt::format("Token '{}' does not address an element of array of size {}", token, current->size()), pointer);
                }

                current = &(*current)[index.value()];
                break;
            }
            case JSON::value_t::null:
            case JSON::value_t::string:
            case JSON::value_t::boolean:
            case JSON::value_t::number_integer:
            case JSON::value_t::number_unsigned:
            case JSON::value_t::number_float:
            case JSON::value_t::binary:
            case JSON::value_t::discarded:
                return Error(ErrorKind::PathResolution,
                    fmt::format("Cannot look up '{}' in {} value", token, current->type_name()), pointer);
        }
    }

    return ResolvedTarget { current, tokens.back() };
}

Optional<Error> PatchEngine::Apply(JSON& document, const PatchOperation& operation) {
    auto target = Resolve(document, operation.Path);
    if (!target) {
        return target.GetError();
    }

    auto& [parent, token] = target.Value();
    try {
        Optional<Error> error;
        switch (operation.Kind) {
            case OpKind::Add:
                error = Add(*parent, token, operation);
                break;
            case OpKind::Remove:
                error = Remove(*parent, token, operation);
                break;
            case OpKind::Replace:
                error = Replace(*parent, token, operation);
                break;
        }

        if (!error.has_value()) {
            mLog->trace("Applied {}", Describe(operation));
        }

        return error;
    }
    catch (const JSON::exception& ex) {
        mLog->error("Failed to apply {}. Error: {}", Describe(operation), ex.what());
        return Error(ErrorKind::UnsupportedTarget, ex.what(), operation.Path);
    }
}

Optional<Error> PatchEngine::Add(JSON& parent, const String& token, const PatchOperation& operation) const {
    if (!operation.Value.has_value()) {
        return fMissingValue(operation);
    }

    switch (parent.type()) {
        case JSON::value_t::object:
            // Add is an upsert on objects
            parent[token] = operation.Value.value();
            return {};
        case JSON::value_t::array: {
            if (token == Keyword::APPEND_MARKER) {
                parent.push_back(operation.Value.value());
                return {};
            }

            auto index = Utils::fParseArrayIndex(token);
            if (!index.has_value()) {
                return fInvalidIndex(parent, token, operation);
            }

            if (index.value() > parent.size()) {
                return Error(ErrorKind::IndexOutOfRange,
                    fmt::format("Index {} is out of range for insertion into array of size {}", index.value(), parent.size()), operation.Path);
            }

            parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(index.value()), operation.Value.value());
            return {};
        }
        case JSON::value_t::null:
        case JSON::value_t::string:
        case JSON::value_t::boolean:
        case JSON::value_t::number_integer:
        case JSON::value_t::number_unsigned:
        case JSON::value_t::number_float:
        case JSON::value_t::binary:
        case JSON::value_t::discarded:
            return fUnsupportedTarget(parent, operation);
    }

    return fUnsupportedTarget(parent, operation);
}

Optional<Error> PatchEngine::Replace(JSON& parent, const String& token, const PatchOperation& operation) const {
    if (!operation.Value.has_value()) {
        return fMissingValue(operation);
    }

    switch (parent.type()) {
        case JSON::value_t::object: {
            auto childIt = parent.find(token);
            if (childIt == parent.end()) {
                return Error(ErrorKind::KeyNotFound, fmt::format("Property '{}' does not exist for replace", token), operation.Path);
            }

            childIt.value() = operation.Value.value();
            return {};
        }
        case JSON::value_t::array: {
            SizeT index = 0;
            if (auto error = fParseExistingIndex(parent, token, operation, index)) {
                return error;
            }

            parent[index] = operation.Value.value();
            return {};
        }
        case JSON::value_t::null:
        case JSON::value_t::string:
        case JSON::value_t::boolean:
        case JSON::value_t::number_integer:
        case JSON::value_t::number_unsigned:
        case JSON::value_t::number_float:
        case JSON::value_t::binary:
        case JSON::value_t::discarded:
            return fUnsupportedTarget(parent, operation);
    }

    return fUnsupportedTarget(parent, operation);
}

Optional<Error> PatchEngine::Remove(JSON& parent, const String& token, const PatchOperation& operation) const {
    switch (parent.type()) {
        case JSON::value_t::object:
            // Same policy as replace: the key has to exist
            if (parent.erase(token) == 0) {
                return Error(ErrorKind::KeyNotFound, fmt::format("Property '{}' does not exist for remove", token), operation.Path);
            }

            return {};
        case JSON::value_t::array: {
            SizeT index = 0;
            if (auto error = fParseExistingIndex(parent, token, operation, index)) {
                return error;
            }

            parent.erase(index);
            return {};
        }
        case JSON::value_t::null:
        case JSON::value_t::string:
        case JSON::value_t::boolean:
        case JSON::value_t::number_integer:
        case JSON::value_t::number_unsigned:
        case JSON::value_t::number_float:
        case JSON::value_t::binary:
        case JSON::value_t::discarded:
            return fUnsupportedTarget(parent, operation);
    }

    return fUnsupportedTarget(parent, operation);
}

} // namespace Json
