/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "JsonCommon.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "PatchError.hpp"
#include "XmlCommon.hpp"

namespace Patch {
using namespace StdLib;

/** ApplyJsonPatch - Apply operations in order to the JSON document, stopping at the first error
 * @return The patched document or the error of the failing operation
 */
Result<Json::JSON> ApplyJsonPatch(Json::JSON document, const Vector<Json::PatchOperation>& operations,
    const SharedPtr<ModuleRegistry>& moduleRegistry = std::make_shared<ModuleRegistry>());

/** ApplyXmlPatch - Apply operations in order to the XML document, stopping at the first error
 * Operations whose XPath matches nothing are skipped.
 * @return The patched document or the error of the failing operation
 */
Result<Xml::DocumentPtr> ApplyXmlPatch(Xml::DocumentPtr document, const Xml::PatchOperationList& operations,
    const SharedPtr<ModuleRegistry>& moduleRegistry = std::make_shared<ModuleRegistry>());
} // namespace Patch
