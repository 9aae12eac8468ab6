#pragma once

// =============================================================================
// Encoding builtins — base64encode, base64decode, base32encode, base32decode
// =============================================================================

#include "builtin_registry.hpp"
#include "../binding/adapter.hpp"
#include "../text/codecs.hpp"

namespace quill
{

    inline void registerEncodingBuiltins(BuiltinTable &t)
    {
        t["base64encode"] = bindFunction("base64encode", &text::base64encode);
        t["base64decode"] = bindFunction("base64decode", &text::base64decode);
        t["base32encode"] = bindFunction("base32encode", &text::base32encode);
        t["base32decode"] = bindFunction("base32decode", &text::base32decode);
    }

} // namespace quill
