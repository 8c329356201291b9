/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "PatchApi.hpp"

#include "JsonPatchEngine.hpp"
#include "PatchDriver.hpp"
#include "XmlPatchEngine.hpp"

namespace Patch {

Result<Json::JSON> ApplyJsonPatch(Json::JSON document, const Vector<Json::PatchOperation>& operations,
    const SharedPtr<ModuleRegistry>& moduleRegistry) {
    PatchDriver<Json::JSON, Json::PatchOperation> driver(std::make_shared<Json::PatchEngine>(moduleRegistry), moduleRegistry);
    return driver.Run(std::move(document), operations);
}

Result<Xml::DocumentPtr> ApplyXmlPatch(Xml::DocumentPtr document, const Xml::PatchOperationList& operations,
    const SharedPtr<ModuleRegistry>& moduleRegistry) {
    PatchDriver<Xml::DocumentPtr, Xml::PatchOperation> driver(std::make_shared<Xml::PatchEngine>(moduleRegistry), moduleRegistry);
    return driver.Run(std::move(document), operations.Operations());
}

} // namespace Patch
