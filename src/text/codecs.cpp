#include "codecs.hpp"
#include "../encoding/base_encoding.hpp"
#include "../lib/errors/error.hpp"

namespace quill
{
    namespace text
    {

        // Decoded bytes must also be UTF-8 text
        static std::string requireText(const encoding::DecodeResult &r)
        {
            if (!r.ok())
                throw DomainError("unable to decode " + r.error);
            std::string bad = encoding::validate_utf8(r.bytes);
            if (!bad.empty())
                throw DomainError("unable to decode: " + bad);
            return r.bytes;
        }

        std::string base64encode(const std::string &s)
        {
            return encoding::base64_encode(s);
        }

        std::string base64decode(const std::string &s)
        {
            return requireText(encoding::base64_decode(s));
        }

        std::string base32encode(const std::string &s)
        {
            return encoding::base32_encode(s);
        }

        std::string base32decode(const std::string &s)
        {
            return requireText(encoding::base32_decode(s));
        }

    } // namespace text
} // namespace quill
