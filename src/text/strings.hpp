#pragma once

// =============================================================================
// Text functions — the statically typed string library
// =============================================================================
//
// Plain C++ functions; the builtins layer binds them to template names.
// Argument order follows template pipelines: the subject string comes last,
// so `"foobar" | trimSuffix "bar"` works.
//
// All indexing is by byte offset. Slicing multi-byte UTF-8 input at a
// non-boundary offset (abbrev, abbrevboth, trunc, substring) produces a
// broken sequence; callers that need codepoint-safe slicing must not rely on
// these functions for it.
//
// Functions report rejected input by throwing DomainError.
// =============================================================================

#include "../binding/convert.hpp"
#include "../value/value.hpp"
#include <cstdint>
#include <string>

namespace quill
{
    namespace text
    {

        /// Upper bound on the bytes repeat builds and replace adds to its input.
        constexpr uint64_t kMaxGeneratedLength = 1u << 20;

        // ---- Truncation ----------------------------------------------------

        /// `abbrev 5 "hello world"` → "he..."
        std::string abbrev(int64_t width, const std::string &s);

        /// `abbrevboth 5 10 "1234 5678 9123"` → "...5678..."
        std::string abbrevboth(int64_t left, int64_t right, const std::string &s);

        /// `trunc 5 "Hello World"` → "Hello"
        std::string trunc(int64_t len, const std::string &s);

        /// Bytes [start, end) of s. Out-of-range requests return s unchanged.
        /// NOTE: the second parameter is an end offset, not a length.
        std::string substring(int64_t start, int64_t end, const std::string &s);

        // ---- Case ----------------------------------------------------------

        std::string initials(const std::string &s);
        std::string untitle(const std::string &s);
        std::string title(const std::string &s);
        std::string upper(const std::string &s);
        std::string lower(const std::string &s);

        // ---- Rewriting -----------------------------------------------------

        std::string replace(const std::string &oldStr, const std::string &newStr,
                            const std::string &s);
        std::string plural(const std::string &one, const std::string &many, int64_t count);
        std::string repeat(int64_t count, const std::string &s);
        std::string nospace(const std::string &s);

        // ---- Lists ---------------------------------------------------------

        /// Element strings of `list` (must be an array) joined by sep.
        std::string join(const std::string &sep, const Value &list);

        /// {"_0": piece0, "_1": piece1, …}
        /// An empty sep gives one piece per character plus an empty piece at
        /// each end: split("", "ab") → {"", "a", "b", ""}.
        StringMap split(const std::string &sep, const std::string &s);

        // ---- Trimming ------------------------------------------------------

        /// Strips Unicode White_Space from both ends. The other whitespace-aware
        /// functions (initials, untitle, title, nospace) only see ASCII spaces.
        std::string trim(const std::string &s);
        std::string trimAll(const std::string &chars, const std::string &s);
        std::string trimSuffix(const std::string &suffix, const std::string &s);
        std::string trimPrefix(const std::string &prefix, const std::string &s);

        // ---- Predicates (needle first) -------------------------------------

        bool contains(const std::string &substr, const std::string &s);
        bool hasSuffix(const std::string &suffix, const std::string &s);
        bool hasPrefix(const std::string &prefix, const std::string &s);

    } // namespace text
} // namespace quill
