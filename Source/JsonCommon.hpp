/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"
#include "PatchOperation.hpp"

#include <nlohmann/json.hpp>

namespace Json {
using namespace StdLib;
using JSON = nlohmann::ordered_json;

constexpr int DEFAULT_OUTPUT_INDENT = 4;

namespace Keyword {
namespace Field {
    static const String OPERATION = "op";
    static const String PATH = "path";
    static const String VALUE = "value";
} // namespace Field

namespace Operation {
    static const String ADD = "add";
    static const String REMOVE = "remove";
    static const String REPLACE = "replace";
} // namespace Operation

// Array token which addresses the position past the last element
static const String APPEND_MARKER = "-";
} // namespace Keyword

/** PatchOperation - One JSON patch instruction.
 * Value is required for add and replace, ignored for remove. A present JSON null is a value.
 */
struct PatchOperation {
    ::Patch::OpKind Kind;
    String Path;
    Optional<JSON> Value;
};
} // namespace Json
