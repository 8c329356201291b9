/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

namespace Xml {
using namespace StdLib;

struct DocumentDeleter {
    void operator()(xmlDoc* document) const { xmlFreeDoc(document); }
};

struct XPathContextDeleter {
    void operator()(xmlXPathContext* context) const { xmlXPathFreeContext(context); }
};

struct XPathObjectDeleter {
    void operator()(xmlXPathObject* object) const { xmlXPathFreeObject(object); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* data) const { xmlFree(data); }
};

using DocumentPtr = UniquePtr<xmlDoc, DocumentDeleter>;
using XPathContextPtr = UniquePtr<xmlXPathContext, XPathContextDeleter>;
using XPathObjectPtr = UniquePtr<xmlXPathObject, XPathObjectDeleter>;
using XmlCharPtr = UniquePtr<xmlChar, XmlCharDeleter>;

namespace Element {
    static const String ADD = "Add";
    static const String REMOVE = "Remove";
    static const String REPLACE = "Replace";
} // namespace Element

namespace Attribute {
    static const String PATH = "path";
    static const String VALUE = "value";
} // namespace Attribute

static inline String fXmlCharToString(const xmlChar* data) {
    return data ? String(reinterpret_cast<const char*>(data)) : String();
}

/** PatchOperation - One child element of the XML patch root.
 * Name, path and value are read as found in the patch; they are validated when the operation is applied.
 * Node points into the patch document owned by PatchOperationList and provides the payload for Add.
 */
struct PatchOperation {
    String Name;
    Optional<String> Path;
    Optional<String> Value;
    xmlNode* Node;
};

/** PatchOperationList - Operations of one XML patch together with the patch document backing them */
class PatchOperationList {
public:
    PatchOperationList(DocumentPtr source, Vector<PatchOperation> operations)
      : mSource(std::move(source)), mOperations(std::move(operations)) {}

    const Vector<PatchOperation>& Operations() const { return mOperations; }
    SizeT Count() const { return mOperations.size(); }

private:
    DocumentPtr mSource;
    Vector<PatchOperation> mOperations;
}; // class PatchOperationList
} // namespace Xml
