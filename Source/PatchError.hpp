/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Patch {
using namespace StdLib;

/** Error - Failure of a patch run, a reader or a single operation.
 * Carries the kind to match on, a human readable message, the offending path (if any) and
 * the zero-based index of the operation which failed (set by the patch driver and readers).
 */
class Error {
public:
    enum class Kind {
        InvalidPath,
        PathResolution,
        IndexOutOfRange,
        KeyNotFound,
        MissingValue,
        UnsupportedTarget,
        UnknownOperation,
        MalformedDocument,
        MalformedPatch,
    };

    Error(Kind kind, String message, String path = {})
      : mKind(kind), mMessage(std::move(message)), mPath(std::move(path)) {}

    Kind GetKind() const { return mKind; }
    const String& Message() const { return mMessage; }
    const String& Path() const { return mPath; }
    Optional<SizeT> OperationIndex() const { return mOperationIndex; }

    Error& SetOperationIndex(SizeT index) {
        mOperationIndex = index;
        return *this;
    }

    /** KindName - Get name of the error kind, e.g. "KeyNotFoundError" */
    String KindName() const;

    /** Describe - Get one line report of the error including path and operation index */
    String Describe() const;

private:
    Kind mKind;
    String mMessage;
    String mPath;
    Optional<SizeT> mOperationIndex;
}; // class Error

/** Result - Either a value of type T or an Error */
template<class T>
class Result {
public:
    Result(T value) : mData(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : mData(std::in_place_index<1>, std::move(error)) {}

    bool HasValue() const { return mData.index() == 0; }
    explicit operator bool() const { return HasValue(); }

    T& Value() & { return std::get<0>(mData); }
    const T& Value() const & { return std::get<0>(mData); }
    T&& Value() && { return std::get<0>(std::move(mData)); }

    const Error& GetError() const { return std::get<1>(mData); }
    Error& GetError() { return std::get<1>(mData); }

private:
    Variant<T, Error> mData;
}; // class Result
} // namespace Patch
