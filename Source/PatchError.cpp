/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "PatchError.hpp"

#include <fmt/core.h>

namespace Patch {

String Error::KindName() const {
    switch (mKind) {
        case Kind::InvalidPath:
            return "InvalidPathError";
        case Kind::PathResolution:
            return "PathResolutionError";
        case Kind::IndexOutOfRange:
            return "IndexOutOfRangeError";
        case Kind::KeyNotFound:
            return "KeyNotFoundError";
        case Kind::MissingValue:
            return "MissingValueError";
        case Kind::UnsupportedTarget:
            return "UnsupportedTargetError";
        case Kind::UnknownOperation:
            return "UnknownOperationError";
        case Kind::MalformedDocument:
            return "MalformedDocumentError";
        case Kind::MalformedPatch:
            return "MalformedPatchError";
    }

    return "UnknownError";
}

String Error::Describe() const {
    String description = fmt::format("{}: {}", KindName(), mMessage);
    if (!mPath.empty()) {
        description += fmt::format(" (path '{}')", mPath);
    }

    if (mOperationIndex.has_value()) {
        description += fmt::format(" (operation #{})", mOperationIndex.value());
    }

    return description;
}

} // namespace Patch
