/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Module {
namespace Name {
    using namespace StdLib;
    const String DATA_STORAGE = "DataStorage";
    const String JSON_ENGINE = "JsonEngine";
    const String PATCH_DRIVER = "PatchDriver";
    const String PATCH_READER = "PatchReader";
    const String XML_ENGINE = "XmlEngine";
} // namespace Name
} // namespace Module
