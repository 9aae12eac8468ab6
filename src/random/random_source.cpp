#include "random_source.hpp"
#include <cerrno>
#include <cstdlib>

namespace quill
{

    Mt19937Source::Mt19937Source()
        : engine_(std::random_device{}()) {}

    Mt19937Source::Mt19937Source(uint64_t seed)
        : engine_(seed) {}

    uint64_t Mt19937Source::below(uint64_t bound)
    {
        std::uniform_int_distribution<uint64_t> dist(0, bound - 1);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(engine_);
    }

    // Parse QUILL_RANDOM_SEED; false if unset or not a plain decimal uint64
    static bool seedFromEnvironment(uint64_t &seed)
    {
        const char *raw = std::getenv("QUILL_RANDOM_SEED");
        if (!raw || !*raw)
            return false;
        for (const char *p = raw; *p; ++p)
        {
            if (*p < '0' || *p > '9')
                return false;
        }
        errno = 0;
        char *end = nullptr;
        unsigned long long v = std::strtoull(raw, &end, 10);
        if (errno == ERANGE || *end != '\0')
            return false;
        seed = static_cast<uint64_t>(v);
        return true;
    }

    std::shared_ptr<RandomSource> defaultRandomSource()
    {
        static std::shared_ptr<RandomSource> source = []() -> std::shared_ptr<RandomSource>
        {
            uint64_t seed = 0;
            if (seedFromEnvironment(seed))
                return std::make_shared<Mt19937Source>(seed);
            return std::make_shared<Mt19937Source>();
        }();
        return source;
    }

} // namespace quill
