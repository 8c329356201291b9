/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "XmlPatchReader.hpp"

#include "Modules.hpp"
#include "XmlPatchEngine.hpp"

#include <fmt/core.h>

namespace Xml {
using Error = ::Patch::Error;
using ErrorKind = ::Patch::Error::Kind;

namespace {
constexpr int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOBLANKS;

DocumentPtr fReadMemory(const ByteStream& data) {
    return DocumentPtr(xmlReadMemory(reinterpret_cast<const char*>(data.data()), static_cast<int>(data.size()),
        nullptr, nullptr, PARSE_OPTIONS));
}

Optional<String> fGetAttribute(xmlNode* node, const String& name) {
    XmlCharPtr value(xmlGetProp(node, BAD_CAST name.c_str()));
    if (!value) {
        return {};
    }

    return fXmlCharToString(value.get());
}
} // namespace

PatchReader::PatchReader(const SharedPtr<ModuleRegistry>& moduleRegistry)
  : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::PATCH_READER)) {
    fRouteDiagnostics(moduleRegistry->Logger(Module::Name::XML_ENGINE));
}

::Patch::Result<DocumentPtr> PatchReader::ParseDocument(const ByteStream& data) const {
    auto document = fReadMemory(data);
    if (!document || (xmlDocGetRootElement(document.get()) == nullptr)) {
        mLog->error("Failed to parse XML document");
        return Error(ErrorKind::MalformedDocument, "Failed to parse XML document");
    }

    mLog->trace("Successfully parsed XML document with root <{}>", fXmlCharToString(xmlDocGetRootElement(document.get())->name));
    return std::move(document);
}

ByteStream PatchReader::SerializeDocument(const xmlDoc& document) const {
    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(const_cast<xmlDoc*>(&document), &buffer, &size, "UTF-8", 1);
    XmlCharPtr data(buffer);
    if (!data || (size <= 0)) {
        mLog->error("Failed to serialize XML document");
        return {};
    }

    return ByteStream(data.get(), data.get() + size);
}

::Patch::Result<PatchOperationList> PatchReader::ParseOperations(const ByteStream& data) const {
    auto patch = fReadMemory(data);
    if (!patch) {
        mLog->error("Failed to parse XML patch");
        return Error(ErrorKind::MalformedPatch, "Failed to parse XML patch");
    }

    xmlNode* root = xmlDocGetRootElement(patch.get());
    if (root == nullptr) {
        mLog->error("XML patch has no root element");
        return Error(ErrorKind::MalformedPatch, "XML patch has no root element");
    }

    Vector<PatchOperation> operations;
    for (xmlNode* node = root->children; node != nullptr; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) {
            continue;
        }

        operations.push_back(PatchOperation {
            fXmlCharToString(node->name),
            fGetAttribute(node, Attribute::PATH),
            fGetAttribute(node, Attribute::VALUE),
            node
        });
    }

    mLog->trace("Successfully read {} XML patch operation(s) from <{}>", operations.size(), fXmlCharToString(root->name));
    return PatchOperationList(std::move(patch), std::move(operations));
}

} // namespace Xml
