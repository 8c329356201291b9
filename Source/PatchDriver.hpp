/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IPatchEngine.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Modules.hpp"

namespace Patch {
using namespace StdLib;

/** PatchDriver - Runs an ordered list of operations against one document.
 * The run stops at the first failing operation. Operations applied before the failure stay
 * applied, so the document may be left partially patched.
 */
template<class DocumentT, class OperationT>
class PatchDriver {
public:
    using Engine = IPatchEngine<DocumentT, OperationT>;

    PatchDriver(SharedPtr<Engine> engine, const SharedPtr<ModuleRegistry>& moduleRegistry)
      : mEngine(std::move(engine)), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->Logger(Module::Name::PATCH_DRIVER)) {}

    /** Run - Apply all operations and hand the document back
     * @return The patched document or the error of the first failing operation
     */
    Result<DocumentT> Run(DocumentT document, const Vector<OperationT>& operations) {
        auto error = RunInPlace(document, operations);
        if (error.has_value()) {
            return std::move(error.value());
        }

        return std::move(document);
    }

    /** RunInPlace - Apply all operations to the document owned by the caller
     * @return Empty value on success, otherwise the error tagged with the failing operation index
     */
    Optional<Error> RunInPlace(DocumentT& document, const Vector<OperationT>& operations) {
        mLog->debug("Applying {} {} patch operation(s)", operations.size(), mEngine->Name());
        for (SizeT i = 0; i < operations.size(); ++i) {
            const auto& operation = operations[i];
            mLog->trace("[{}/{}] {}", i + 1, operations.size(), mEngine->Describe(operation));
            auto error = mEngine->Apply(document, operation);
            if (error.has_value()) {
                error->SetOperationIndex(i);
                mLog->error("Failed to apply {} patch at operation #{} ({}). Error: {}",
                    mEngine->Name(), i, mEngine->Describe(operation), error->Describe());
                return error;
            }
        }

        mLog->debug("Successfully applied {} {} patch operation(s)", operations.size(), mEngine->Name());
        return {};
    }

private:
    SharedPtr<Engine> mEngine;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class PatchDriver
} // namespace Patch
