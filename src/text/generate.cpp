#include "generate.hpp"
#include "../lib/errors/error.hpp"
#include <new>
#include <stdexcept>

namespace quill
{
    namespace text
    {

        static const std::string kDigits = "0123456789";
        static const std::string kLetters =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
        static const std::string kAlphaNumeric = kLetters + kDigits;

        static std::string printableAscii()
        {
            std::string chars;
            for (char c = 0x20; c < 0x7F; ++c)
                chars += c;
            return chars;
        }

        static std::string draw(RandomSource &rng, uint64_t count, const std::string &alphabet)
        {
            std::string out;
            if (count > out.max_size())
                throw DomainError("count " + std::to_string(count) + " exceeds maximum of " +
                                  std::to_string(out.max_size()));
            try
            {
                out.reserve((size_t)count);
            }
            catch (const std::bad_alloc &)
            {
                throw DomainError("count " + std::to_string(count) + " is too large to allocate");
            }
            catch (const std::length_error &)
            {
                throw DomainError("count " + std::to_string(count) + " is too large to allocate");
            }
            for (uint64_t i = 0; i < count; ++i)
                out += alphabet[(size_t)rng.below(alphabet.size())];
            return out;
        }

        std::string randAlphaNumeric(RandomSource &rng, uint64_t count)
        {
            return draw(rng, count, kAlphaNumeric);
        }

        std::string randAlpha(RandomSource &rng, uint64_t count)
        {
            return draw(rng, count, kLetters);
        }

        std::string randAscii(RandomSource &rng, uint64_t count)
        {
            static const std::string ascii = printableAscii();
            return draw(rng, count, ascii);
        }

        std::string randNumeric(RandomSource &rng, uint64_t count)
        {
            return draw(rng, count, kDigits);
        }

    } // namespace text
} // namespace quill
