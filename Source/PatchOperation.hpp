/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Patch {
enum class OpKind {
    Add,
    Remove,
    Replace,
};

static inline StdLib::String fOpKindName(OpKind kind) {
    switch (kind) {
        case OpKind::Add:
            return "add";
        case OpKind::Remove:
            return "remove";
        case OpKind::Replace:
            return "replace";
    }

    return "unknown";
}
} // namespace Patch
