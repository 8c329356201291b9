/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IPatchEngine.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "PatchOperation.hpp"
#include "XmlCommon.hpp"

namespace Xml {
using namespace StdLib;

class PatchEngine : public ::Patch::IPatchEngine<DocumentPtr, PatchOperation> {
public:
    explicit PatchEngine(const SharedPtr<ModuleRegistry>& moduleRegistry);
    ~PatchEngine() override = default;

    String Name() const override { return "XML"; }
    String Describe(const PatchOperation& operation) const override;

    /** Resolve - Evaluate the XPath expression against the document
     * When more elements match, the first one in document order is returned.
     * @return The matching element, nullptr if nothing matches, or InvalidPath error
     */
    ::Patch::Result<xmlNode*> Resolve(xmlDoc& document, const String& xpath) const;

    Optional<::Patch::Error> Apply(DocumentPtr& document, const PatchOperation& operation) override;

private:
    Optional<::Patch::Error> Add(xmlNode& target, const PatchOperation& operation) const;
    Optional<::Patch::Error> Replace(xmlNode& target, const PatchOperation& operation) const;
    Optional<::Patch::Error> Remove(xmlNode* target, const PatchOperation& operation) const;

    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class PatchEngine

/** fParseOperationName - Map patch element name onto operation kind. Names are case sensitive. */
Optional<::Patch::OpKind> fParseOperationName(const String& name);

/** fRouteDiagnostics - Send libxml2 error output to the given logger instead of stderr */
void fRouteDiagnostics(SharedPtr<Log::SpdLogger> logger);
} // namespace Xml
