#pragma once

// =============================================================================
// Random string generators — randAlphaNum, randAlpha, randAscii, randNumeric
// =============================================================================
// Each returns exactly `count` characters drawn uniformly from its alphabet.
// A count too large to allocate throws DomainError.
// =============================================================================

#include "../random/random_source.hpp"
#include <cstdint>
#include <string>

namespace quill
{
    namespace text
    {

        std::string randAlphaNumeric(RandomSource &rng, uint64_t count);
        std::string randAlpha(RandomSource &rng, uint64_t count);

        /// Printable ASCII, 0x20 (space) through 0x7E
        std::string randAscii(RandomSource &rng, uint64_t count);

        std::string randNumeric(RandomSource &rng, uint64_t count);

    } // namespace text
} // namespace quill
