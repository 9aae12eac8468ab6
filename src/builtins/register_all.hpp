#pragma once

// =============================================================================
// register_all.hpp — wire every builtin category into a function table
// =============================================================================
//
// Usage (from the template engine's setup):
//     BuiltinTable table;
//     registerAllBuiltins(table);
//
// To add a new category:
//   1. #include "builtins_<category>.hpp"
//   2. Call register<Category>Builtins(t, ...) below.
//
// =============================================================================

#include "builtin_registry.hpp"
#include "builtins_encoding.hpp"
#include "builtins_random.hpp"
#include "builtins_string.hpp"

namespace quill
{

    /// Registers every built-in function into the given table.
    /// @param t       The engine's builtin table.
    /// @param random  Source for the rand* functions; tests pass a
    ///                deterministic one.
    inline void registerAllBuiltins(BuiltinTable &t,
                                    std::shared_ptr<RandomSource> random = defaultRandomSource())
    {
        registerEncodingBuiltins(t);
        registerStringBuiltins(t);
        registerRandomBuiltins(t, std::move(random));
    }

} // namespace quill
