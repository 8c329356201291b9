/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */

#pragma once

// Headers arranged in alphabetical order
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/** Provides aliases for types from C++ Standard Library */
namespace StdLib {
// Aliases arranged in alphabetical order
using Exception = std::exception;
using IFStream = std::ifstream;
using OFStream = std::ofstream;
using OStrStream = std::ostringstream;
using SizeT = std::size_t;
using String = std::string;
using StringView = std::string_view;

template<class T> using Optional = std::optional<T>;
template<class T> using SharedPtr = std::shared_ptr<T>;
template<class T, class Deleter = std::default_delete<T>> using UniquePtr = std::unique_ptr<T, Deleter>;
template<class T> using Vector = std::vector<T>;

template<class Key, class T> using Map = std::map<Key, T>;
template<class T1, class T2> using Pair = std::pair<T1, T2>;
template<class... Types> using Variant = std::variant<Types...>;
} // namespace StdLib
