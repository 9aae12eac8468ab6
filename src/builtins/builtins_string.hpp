#pragma once

// =============================================================================
// String builtins — abbrev, abbrevboth, trunc, substr, initials, untitle,
//                   title, upper, lower, replace, plural, repeat, nospace,
//                   join, split, trim, trimAll, trimSuffix, trimPrefix,
//                   contains, hasSuffix, hasPrefix
// =============================================================================

#include "builtin_registry.hpp"
#include "../binding/adapter.hpp"
#include "../text/strings.hpp"

namespace quill
{

    inline void registerStringBuiltins(BuiltinTable &t)
    {
        // abbrev(width, str) → "he..."
        t["abbrev"] = bindFunction("abbrev", &text::abbrev);
        // abbrevboth(left, right, str) → "...lo wo..."
        t["abbrevboth"] = bindFunction("abbrevboth", &text::abbrevboth);
        // trunc(len, str) → prefix, no ellipsis
        t["trunc"] = bindFunction("trunc", &text::trunc);
        // substr(start, end, str) → bytes [start, end)
        t["substr"] = bindFunction("substr", &text::substring);

        t["initials"] = bindFunction("initials", &text::initials);
        t["untitle"] = bindFunction("untitle", &text::untitle);
        t["title"] = bindFunction("title", &text::title);
        t["upper"] = bindFunction("upper", &text::upper);
        t["lower"] = bindFunction("lower", &text::lower);

        // replace(old, new, str) → every occurrence replaced
        t["replace"] = bindFunction("replace", &text::replace);
        // plural(one, many, count)
        t["plural"] = bindFunction("plural", &text::plural);
        t["repeat"] = bindFunction("repeat", &text::repeat);
        t["nospace"] = bindFunction("nospace", &text::nospace);

        // join(sep, array) → string
        t["join"] = bindFunction("join", &text::join);
        // split(sep, str) → map {_0: …, _1: …}
        t["split"] = bindFunction("split", &text::split);

        t["trim"] = bindFunction("trim", &text::trim);
        // trimAll(chars, str) → both ends stripped of any byte in chars
        t["trimAll"] = bindFunction("trimAll", &text::trimAll);
        t["trimSuffix"] = bindFunction("trimSuffix", &text::trimSuffix);
        t["trimPrefix"] = bindFunction("trimPrefix", &text::trimPrefix);

        // contains / hasSuffix / hasPrefix (needle, str) → bool
        t["contains"] = bindFunction("contains", &text::contains);
        t["hasSuffix"] = bindFunction("hasSuffix", &text::hasSuffix);
        t["hasPrefix"] = bindFunction("hasPrefix", &text::hasPrefix);
    }

} // namespace quill
