#pragma once

// =============================================================================
// Random builtins — randAlphaNum, randAlpha, randAscii, randNumeric
// =============================================================================
// Each bound function keeps the RandomSource alive through its capture.
// =============================================================================

#include "builtin_registry.hpp"
#include "../binding/adapter.hpp"
#include "../text/generate.hpp"
#include <memory>

namespace quill
{

    inline void registerRandomBuiltins(BuiltinTable &t, std::shared_ptr<RandomSource> random)
    {
        using Generator = std::string (*)(RandomSource &, uint64_t);

        auto bindGenerator = [&random](const std::string &name, Generator gen)
        {
            std::function<std::string(uint64_t)> fn = [random, gen](uint64_t count)
            {
                return gen(*random, count);
            };
            return bindFunction(name, std::move(fn));
        };

        t["randAlphaNum"] = bindGenerator("randAlphaNum", &text::randAlphaNumeric);
        t["randAlpha"] = bindGenerator("randAlpha", &text::randAlpha);
        t["randAscii"] = bindGenerator("randAscii", &text::randAscii);
        t["randNumeric"] = bindGenerator("randNumeric", &text::randNumeric);
    }

} // namespace quill
