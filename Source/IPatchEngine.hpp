/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"
#include "PatchError.hpp"

namespace Patch {
using namespace StdLib;

/** IPatchEngine - Applies single patch operations to one kind of document tree.
 * Every engine resolves the operation path against the document and performs the mutation in place.
 */
template<class DocumentT, class OperationT>
class IPatchEngine {
public:
    using Document = DocumentT;
    using Operation = OperationT;

    virtual ~IPatchEngine() = default;

    /** Name - Get name of the document variant handled by the engine */
    virtual String Name() const = 0;

    /** Describe - Get short text describing the operation, e.g. "add '/a/b'" */
    virtual String Describe(const Operation& operation) const = 0;

    /** Apply - Apply the operation to the document
     * @return Empty value on success, otherwise the error which made the operation fail
     */
    virtual Optional<Error> Apply(Document& document, const Operation& operation) = 0;
}; // class IPatchEngine
} // namespace Patch
