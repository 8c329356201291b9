/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "XmlPatchEngine.hpp"

#include "Modules.hpp"

#include <fmt/core.h>

#include <libxml/xmlerror.h>
#include <libxml/xpathInternals.h>

#include <cstdarg>
#include <cstdio>

namespace Xml {
using Error = ::Patch::Error;
using ErrorKind = ::Patch::Error::Kind;
using OpKind = ::Patch::OpKind;

namespace {
SharedPtr<Log::SpdLogger> gDiagnosticsLog;
String gDiagnosticsLine;

// libxml2 emits one diagnostic in several chunks, so lines are collected before logging
void fForwardDiagnostics([[maybe_unused]] void* context, const char* format, ...) {
    if (!gDiagnosticsLog) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list sizeArgs;
    va_copy(sizeArgs, args);
    const int size = std::vsnprintf(nullptr, 0, format, sizeArgs);
    va_end(sizeArgs);
    if (size <= 0) {
        va_end(args);
        return;
    }

    String chunk(static_cast<SizeT>(size) + 1, '\0');
    std::vsnprintf(chunk.data(), chunk.size(), format, args);
    va_end(args);
    chunk.resize(static_cast<SizeT>(size));

    gDiagnosticsLine += chunk;
    for (auto pos = gDiagnosticsLine.find('\n'); pos != String::npos; pos = gDiagnosticsLine.find('\n')) {
        if (pos > 0) {
            gDiagnosticsLog->debug("libxml2: {}", gDiagnosticsLine.substr(0, pos));
        }

        gDiagnosticsLine.erase(0, pos + 1);
    }
}
} // namespace

Optional<::Patch::OpKind> fParseOperationName(const String& name) {
    if (name == Element::ADD) {
        return OpKind::Add;
    }

    if (name == Element::REMOVE) {
        return OpKind::Remove;
    }

    if (name == Element::REPLACE) {
        return OpKind::Replace;
    }

    return {};
}

void fRouteDiagnostics(SharedPtr<Log::SpdLogger> logger) {
    gDiagnosticsLog = std::move(logger);
    xmlSetGenericErrorFunc(nullptr, fForwardDiagnostics);
}

PatchEngine::PatchEngine(const SharedPtr<ModuleRegistry>& moduleRegistry)
  : mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::XML_ENGINE)) {
    fRouteDiagnostics(mLog);
}

String PatchEngine::Describe(const PatchOperation& operation) const {
    return fmt::format("<{}> '{}'", operation.Name, operation.Path.value_or(""));
}

::Patch::Result<xmlNode*> PatchEngine::Resolve(xmlDoc& document, const String& xpath) const {
    if (xpath.empty()) {
        return Error(ErrorKind::InvalidPath, "Path cannot be empty", xpath);
    }

    XPathContextPtr context(xmlXPathNewContext(&document));
    if (!context) {
        return Error(ErrorKind::UnsupportedTarget, "Failed to create XPath context", xpath);
    }

    XPathObjectPtr result(xmlXPathEvalExpression(BAD_CAST xpath.c_str(), context.get()));
    if (!result) {
        return Error(ErrorKind::InvalidPath, "Invalid XPath expression", xpath);
    }

    if (result->type != XPATH_NODESET) {
        return Error(ErrorKind::InvalidPath, "XPath expression does not select elements", xpath);
    }

    xmlNodeSet* nodes = result->nodesetval;
    if (xmlXPathNodeSetIsEmpty(nodes)) {
        return static_cast<xmlNode*>(nullptr);
    }

    // First match wins, so the order has to be the document order
    xmlXPathNodeSetSort(nodes);
    for (int i = 0; i < nodes->nodeNr; ++i) {
        if (nodes->nodeTab[i]->type == XML_ELEMENT_NODE) {
            return nodes->nodeTab[i];
        }
    }

    return static_cast<xmlNode*>(nullptr);
}

Optional<Error> PatchEngine::Apply(DocumentPtr& document, const PatchOperation& operation) {
    if (!operation.Path.has_value()) {
        return Error(ErrorKind::InvalidPath, fmt::format("Missing '{}' attribute", Attribute::PATH));
    }

    auto kind = fParseOperationName(operation.Name);
    if (!kind.has_value()) {
        return Error(ErrorKind::UnknownOperation,
            fmt::format("Unknown XML patch element '{}'", operation.Name), operation.Path.value());
    }

    if (!document) {
        return Error(ErrorKind::UnsupportedTarget, "There is no XML document to patch", operation.Path.value());
    }

    auto target = Resolve(*document, operation.Path.value());
    if (!target) {
        return target.GetError();
    }

    xmlNode* element = target.Value();
    if (element == nullptr) {
        mLog->debug("No element matches '{}', skipped {}", operation.Path.value(), Describe(operation));
        return {};
    }

    Optional<Error> error;
    switch (kind.value()) {
        case OpKind::Add:
            error = Add(*element, operation);
            break;
        case OpKind::Remove:
            error = Remove(element, operation);
            break;
        case OpKind::Replace:
            error = Replace(*element, operation);
            break;
    }

    if (!error.has_value()) {
        mLog->trace("Applied {}", Describe(operation));
    }

    return error;
}

Optional<Error> PatchEngine::Add(xmlNode& target, const PatchOperation& operation) const {
    if (operation.Node == nullptr) {
        return {};
    }

    for (xmlNode* child = operation.Node->children; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }

        xmlNode* copy = xmlDocCopyNode(child, target.doc, 1);
        if (copy == nullptr) {
            return Error(ErrorKind::UnsupportedTarget,
                fmt::format("Failed to copy element <{}>", fXmlCharToString(child->name)), operation.Path.value_or(""));
        }

        if (xmlAddChild(&target, copy) == nullptr) {
            xmlFreeNode(copy);
            return Error(ErrorKind::UnsupportedTarget,
                fmt::format("Failed to append element <{}>", fXmlCharToString(child->name)), operation.Path.value_or(""));
        }
    }

    return {};
}

Optional<Error> PatchEngine::Replace(xmlNode& target, const PatchOperation& operation) const {
    if (!operation.Value.has_value()) {
        return Error(ErrorKind::MissingValue,
            fmt::format("Replace requires '{}' attribute", Attribute::VALUE), operation.Path.value_or(""));
    }

    const auto& value = operation.Value.value();
    // Drops all children, attributes are kept
    xmlNodeSetContent(&target, nullptr);
    // Text is added verbatim, entities are not interpreted
    xmlNodeAddContentLen(&target, BAD_CAST value.c_str(), static_cast<int>(value.size()));
    return {};
}

Optional<Error> PatchEngine::Remove(xmlNode* target, const PatchOperation& operation) const {
    if ((target->parent == nullptr) || (target->parent->type != XML_ELEMENT_NODE)) {
        return Error(ErrorKind::UnsupportedTarget, "Cannot remove the document root element", operation.Path.value_or(""));
    }

    xmlUnlinkNode(target);
    xmlFreeNode(target);
    return {};
}

} // namespace Xml
