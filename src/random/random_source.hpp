#pragma once

// =============================================================================
// RandomSource — the randomness behind randAlpha / randAscii / …
// =============================================================================
//
// The rand* builtins draw from a RandomSource handed to registerAllBuiltins().
// Production code shares one process-wide source (defaultRandomSource());
// tests inject their own to get deterministic output.
//
// Implementations must be safe to call from several threads at once.
// =============================================================================

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace quill
{

    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        /// Uniform integer in [0, bound). bound must be > 0.
        virtual uint64_t below(uint64_t bound) = 0;
    };

    /// Mersenne Twister behind a mutex.
    class Mt19937Source : public RandomSource
    {
    public:
        /// Seeded from std::random_device
        Mt19937Source();
        explicit Mt19937Source(uint64_t seed);

        uint64_t below(uint64_t bound) override;

    private:
        std::mutex mutex_;
        std::mt19937_64 engine_;
    };

    /// The shared process-wide source. Seeded from QUILL_RANDOM_SEED when that
    /// environment variable holds a decimal uint64, else from random_device.
    std::shared_ptr<RandomSource> defaultRandomSource();

} // namespace quill
