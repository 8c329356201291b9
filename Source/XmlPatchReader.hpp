/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Common.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "PatchError.hpp"
#include "XmlCommon.hpp"

namespace Xml {
using namespace StdLib;

/** PatchReader - Converts between bytes and XML documents or XML patch operation lists */
class PatchReader {
public:
    explicit PatchReader(const SharedPtr<ModuleRegistry>& moduleRegistry);

    ::Patch::Result<DocumentPtr> ParseDocument(const ByteStream& data) const;
    ByteStream SerializeDocument(const xmlDoc& document) const;

    /** ParseOperations - Read the element children of the patch root in patch order.
     * Entries are not validated here, unknown elements and missing attributes are reported when applied.
     */
    ::Patch::Result<PatchOperationList> ParseOperations(const ByteStream& data) const;

private:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class PatchReader
} // namespace Xml
