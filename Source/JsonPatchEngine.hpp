/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IPatchEngine.hpp"
#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"

namespace Json {
using namespace StdLib;

/** ResolvedTarget - Container which holds the addressed location and the last pointer token.
 * The token is not interpreted, its meaning depends on the operation.
 */
struct ResolvedTarget {
    JSON* Parent;
    String Token;
};

class PatchEngine : public ::Patch::IPatchEngine<JSON, PatchOperation> {
public:
    explicit PatchEngine(const SharedPtr<ModuleRegistry>& moduleRegistry);
    ~PatchEngine() override = default;

    String Name() const override { return "JSON"; }
    String Describe(const PatchOperation& operation) const override;

    /** Resolve - Walk the JSON Pointer down to the parent of the addressed location
     * @param document Root of the document
     * @param pointer JSON Pointer (RFC 6901) with at least one token
     * @return Parent container and the last token or InvalidPath/PathResolution error
     */
    ::Patch::Result<ResolvedTarget> Resolve(JSON& document, const String& pointer) const;

    Optional<::Patch::Error> Apply(JSON& document, const PatchOperation& operation) override;

private:
    Optional<::Patch::Error> Add(JSON& parent, const String& token, const PatchOperation& operation) const;
    Optional<::Patch::Error> Replace(JSON& parent, const String& token, const PatchOperation& operation) const;
    Optional<::Patch::Error> Remove(JSON& parent, const String& token, const PatchOperation& operation) const;

    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class PatchEngine
} // namespace Json
