#pragma once

// =============================================================================
// Base Encodings — RFC 4648 base-64 / base-32 and UTF-8 validation
// =============================================================================
//
// Pure, standalone byte algorithms used by the encoding builtins.
//
//   base64_encode / base64_decode : standard alphabet, '=' padding
//   base32_encode / base32_decode : standard alphabet, '=' padding
//   validate_utf8                 : "" if valid, otherwise a description
//
// Decoding is strict: the input length must be a whole number of blocks,
// padding may only appear at the end and must have a legal length, and the
// unused bits of the last symbol must be zero. Errors name the offending
// input offset, e.g. "invalid symbol at 3".
//
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string>

namespace quill
{
    namespace encoding
    {

        struct DecodeResult
        {
            std::string bytes;
            std::string error; // empty on success

            bool ok() const { return error.empty(); }
        };

        inline DecodeResult decode_failure(const char *what, size_t at)
        {
            DecodeResult r;
            r.error = std::string(what) + " at " + std::to_string(at);
            return r;
        }

        // ====================================================================
        // Base-64
        // ====================================================================

        constexpr char BASE64_ALPHABET[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        inline int base64_index(unsigned char c)
        {
            if (c >= 'A' && c <= 'Z')
                return c - 'A';
            if (c >= 'a' && c <= 'z')
                return c - 'a' + 26;
            if (c >= '0' && c <= '9')
                return c - '0' + 52;
            if (c == '+')
                return 62;
            if (c == '/')
                return 63;
            return -1;
        }

        inline std::string base64_encode(const std::string &in)
        {
            std::string out;
            out.reserve((in.size() + 2) / 3 * 4);
            size_t i = 0;
            for (; i + 3 <= in.size(); i += 3)
            {
                uint32_t n = (uint32_t)(uint8_t)in[i] << 16 |
                             (uint32_t)(uint8_t)in[i + 1] << 8 |
                             (uint32_t)(uint8_t)in[i + 2];
                out += BASE64_ALPHABET[(n >> 18) & 0x3F];
                out += BASE64_ALPHABET[(n >> 12) & 0x3F];
                out += BASE64_ALPHABET[(n >> 6) & 0x3F];
                out += BASE64_ALPHABET[n & 0x3F];
            }
            size_t rest = in.size() - i;
            if (rest == 1)
            {
                uint32_t n = (uint32_t)(uint8_t)in[i] << 16;
                out += BASE64_ALPHABET[(n >> 18) & 0x3F];
                out += BASE64_ALPHABET[(n >> 12) & 0x3F];
                out += "==";
            }
            else if (rest == 2)
            {
                uint32_t n = (uint32_t)(uint8_t)in[i] << 16 |
                             (uint32_t)(uint8_t)in[i + 1] << 8;
                out += BASE64_ALPHABET[(n >> 18) & 0x3F];
                out += BASE64_ALPHABET[(n >> 12) & 0x3F];
                out += BASE64_ALPHABET[(n >> 6) & 0x3F];
                out += '=';
            }
            return out;
        }

        inline DecodeResult base64_decode(const std::string &in)
        {
            if (in.size() % 4 != 0)
                return decode_failure("invalid length", in.size() - in.size() % 4);

            DecodeResult r;
            r.bytes.reserve(in.size() / 4 * 3);
            for (size_t block = 0; block < in.size(); block += 4)
            {
                bool last = block + 4 == in.size();

                // Count trailing padding in this block (only legal in the last one)
                size_t pad = 0;
                while (pad < 4 && in[block + 3 - pad] == '=')
                    ++pad;
                if (pad > 0 && !last)
                    return decode_failure("invalid padding length", block + 4 - pad);
                if (pad > 2)
                    return decode_failure("invalid padding length", block + 4 - pad);

                uint32_t n = 0;
                for (size_t j = 0; j < 4 - pad; ++j)
                {
                    int v = base64_index((unsigned char)in[block + j]);
                    if (v < 0)
                        return decode_failure("invalid symbol", block + j);
                    n |= (uint32_t)v << (18 - 6 * j);
                }

                if (pad == 2 && (n & 0xFFFF) != 0)
                    return decode_failure("non-zero trailing bits", block + 1);
                if (pad == 1 && (n & 0xFF) != 0)
                    return decode_failure("non-zero trailing bits", block + 2);

                r.bytes += (char)((n >> 16) & 0xFF);
                if (pad < 2)
                    r.bytes += (char)((n >> 8) & 0xFF);
                if (pad < 1)
                    r.bytes += (char)(n & 0xFF);
            }
            return r;
        }

        // ====================================================================
        // Base-32
        // ====================================================================
        // 5 input bytes → 8 symbols. A final partial block of 1..4 bytes
        // produces 2, 4, 5 or 7 symbols followed by 6, 4, 3 or 1 '='.

        constexpr char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

        inline int base32_index(unsigned char c)
        {
            if (c >= 'A' && c <= 'Z')
                return c - 'A';
            if (c >= '2' && c <= '7')
                return c - '2' + 26;
            return -1;
        }

        inline std::string base32_encode(const std::string &in)
        {
            static const size_t symbolsFor[5] = {0, 2, 4, 5, 7};

            std::string out;
            out.reserve((in.size() + 4) / 5 * 8);
            for (size_t i = 0; i < in.size(); i += 5)
            {
                size_t take = in.size() - i < 5 ? in.size() - i : 5;
                uint64_t n = 0;
                for (size_t j = 0; j < 5; ++j)
                {
                    n <<= 8;
                    if (j < take)
                        n |= (uint8_t)in[i + j];
                }
                size_t symbols = take == 5 ? 8 : symbolsFor[take];
                for (size_t j = 0; j < 8; ++j)
                {
                    if (j < symbols)
                        out += BASE32_ALPHABET[(n >> (35 - 5 * j)) & 0x1F];
                    else
                        out += '=';
                }
            }
            return out;
        }

        inline DecodeResult base32_decode(const std::string &in)
        {
            if (in.size() % 8 != 0)
                return decode_failure("invalid length", in.size() - in.size() % 8);

            DecodeResult r;
            r.bytes.reserve(in.size() / 8 * 5);
            for (size_t block = 0; block < in.size(); block += 8)
            {
                bool last = block + 8 == in.size();

                size_t pad = 0;
                while (pad < 8 && in[block + 7 - pad] == '=')
                    ++pad;
                if (pad > 0 && !last)
                    return decode_failure("invalid padding length", block + 8 - pad);

                // Padding length → number of output bytes in this block
                size_t bytes;
                switch (pad)
                {
                case 0:
                    bytes = 5;
                    break;
                case 1:
                    bytes = 4;
                    break;
                case 3:
                    bytes = 3;
                    break;
                case 4:
                    bytes = 2;
                    break;
                case 6:
                    bytes = 1;
                    break;
                default:
                    return decode_failure("invalid padding length", block + 8 - pad);
                }

                size_t symbols = 8 - pad;
                uint64_t n = 0;
                for (size_t j = 0; j < 8; ++j)
                {
                    n <<= 5;
                    if (j >= symbols)
                        continue;
                    int v = base32_index((unsigned char)in[block + j]);
                    if (v < 0)
                        return decode_failure("invalid symbol", block + j);
                    n |= (uint64_t)v;
                }

                // Bits below the last real byte must be zero
                uint64_t unused = (uint64_t(1) << (40 - 8 * bytes)) - 1;
                if ((n & unused) != 0)
                    return decode_failure("non-zero trailing bits", block + symbols - 1);

                for (size_t j = 0; j < bytes; ++j)
                    r.bytes += (char)((n >> (32 - 8 * j)) & 0xFF);
            }
            return r;
        }

        // ====================================================================
        // UTF-8 validation
        // ====================================================================
        // Rejects overlong forms, surrogates (U+D800..U+DFFF) and code points
        // above U+10FFFF.

        inline std::string validate_utf8(const std::string &s)
        {
            size_t i = 0;
            while (i < s.size())
            {
                unsigned char c = (unsigned char)s[i];
                if (c < 0x80)
                {
                    ++i;
                    continue;
                }

                size_t need;
                unsigned char lo = 0x80, hi = 0xBF; // range of the 2nd byte
                if (c >= 0xC2 && c <= 0xDF)
                    need = 1;
                else if (c >= 0xE0 && c <= 0xEF)
                {
                    need = 2;
                    if (c == 0xE0)
                        lo = 0xA0;
                    else if (c == 0xED)
                        hi = 0x9F;
                }
                else if (c >= 0xF0 && c <= 0xF4)
                {
                    need = 3;
                    if (c == 0xF0)
                        lo = 0x90;
                    else if (c == 0xF4)
                        hi = 0x8F;
                }
                else
                    return "invalid utf-8 sequence of 1 bytes from index " + std::to_string(i);

                // Length of the valid prefix of this sequence
                size_t valid = 1;
                for (size_t k = 1; k <= need; ++k)
                {
                    if (i + k >= s.size())
                        return "incomplete utf-8 byte sequence from index " + std::to_string(i);
                    unsigned char cc = (unsigned char)s[i + k];
                    unsigned char kLo = k == 1 ? lo : 0x80;
                    unsigned char kHi = k == 1 ? hi : 0xBF;
                    if (cc < kLo || cc > kHi)
                        return "invalid utf-8 sequence of " + std::to_string(valid) +
                               " bytes from index " + std::to_string(i);
                    ++valid;
                }
                i += need + 1;
            }
            return "";
        }

        /// Length in bytes of the UTF-8 sequence starting with lead byte `c`
        /// (1 for ASCII and for stray continuation/invalid bytes).
        inline size_t utf8_sequence_length(unsigned char c)
        {
            if (c >= 0xF0 && c <= 0xF7)
                return 4;
            if (c >= 0xE0)
                return c <= 0xEF ? 3 : 1;
            if (c >= 0xC0)
                return 2;
            return 1;
        }

    } // namespace encoding
} // namespace quill
