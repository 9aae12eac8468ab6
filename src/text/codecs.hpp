#pragma once

// =============================================================================
// Codec functions — base64encode / base64decode / base32encode / base32decode
// =============================================================================
// Decoders throw DomainError when the payload is not valid for the alphabet
// ("unable to decode <reason>") or does not decode to UTF-8 text
// ("unable to decode: <reason>").
// =============================================================================

#include <string>

namespace quill
{
    namespace text
    {

        std::string base64encode(const std::string &s);
        std::string base64decode(const std::string &s);
        std::string base32encode(const std::string &s);
        std::string base32decode(const std::string &s);

    } // namespace text
} // namespace quill
