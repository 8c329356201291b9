/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Common.hpp"
#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "PatchError.hpp"

#include <nlohmann/json-schema.hpp>

namespace Json {
using namespace StdLib;

/** PatchReader - Converts between bytes and JSON documents or JSON patch operation lists */
class PatchReader {
public:
    explicit PatchReader(const SharedPtr<ModuleRegistry>& moduleRegistry);

    ::Patch::Result<JSON> ParseDocument(const ByteStream& data) const;
    ByteStream SerializeDocument(const JSON& document) const;

    /** ParseOperations - Read list of patch operations
     * Property and operation names are matched case insensitively.
     * @return Operations in patch order, MalformedPatch or UnknownOperation error
     */
    ::Patch::Result<Vector<PatchOperation>> ParseOperations(const ByteStream& data) const;

private:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
    nlohmann::json_schema::json_validator mValidator;

    class ErrorHandler : public nlohmann::json_schema::basic_error_handler {
    public:
        String MsgError() const { return mErrors.str(); }

    private:
        void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &message) override {
            nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
            mErrors << "'" << ptr.to_string() << "' >> '" << instance.dump() << "': " << message << "\n";
        }

        OStrStream mErrors;
    };
}; // class PatchReader
} // namespace Json
