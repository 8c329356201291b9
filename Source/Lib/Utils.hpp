/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "StdLib.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace Utils {
using namespace StdLib;

static inline String fToLower(StringView s) {
    String lowered(s);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

static inline bool fIsCanonicalDigits(StringView token) {
    if (token.empty() || ((token.size() > 1) && (token.front() == '0'))) {
        return false;
    }

    return std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

/** fIsIntegerToken - Check if the token is a canonical decimal integer, optionally negative.
 * Such a token names an array position even when no element can exist there ("-1", huge numbers).
 */
static inline bool fIsIntegerToken(StringView token) {
    if (!token.empty() && (token.front() == '-')) {
        token.remove_prefix(1);
    }

    return fIsCanonicalDigits(token);
}

/** fParseArrayIndex - Parse an array index token of a JSON Pointer
 * Only the canonical decimal form is accepted: digits only, no sign and no leading zeros
 * (except for "0" itself).
 * @return The index or empty value if the token is not a valid index
 */
static inline Optional<SizeT> fParseArrayIndex(StringView token) {
    if (!fIsCanonicalDigits(token)) {
        return {};
    }

    SizeT index = 0;
    auto [ptr, errCode] = std::from_chars(token.data(), token.data() + token.size(), index);
    if ((errCode != std::errc()) || (ptr != token.data() + token.size())) {
        // Value does not fit into the index type
        return {};
    }

    return index;
}

} // namespace Utils
