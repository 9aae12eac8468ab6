#include "strings.hpp"
#include "../encoding/base_encoding.hpp"
#include "../lib/errors/error.hpp"
#include <algorithm>
#include <cctype>

namespace quill
{
    namespace text
    {

        static bool isSpace(char c)
        {
            return std::isspace((unsigned char)c) != 0;
        }

        // Multi-byte UTF-8 encodings of the Unicode White_Space characters
        static const char *const kUnicodeSpaces[] = {
            "\xc2\x85", "\xc2\xa0", "\xe1\x9a\x80",
            // U+2000 .. U+200A
            "\xe2\x80\x80", "\xe2\x80\x81", "\xe2\x80\x82", "\xe2\x80\x83",
            "\xe2\x80\x84", "\xe2\x80\x85", "\xe2\x80\x86", "\xe2\x80\x87",
            "\xe2\x80\x88", "\xe2\x80\x89", "\xe2\x80\x8a",
            "\xe2\x80\xa8", "\xe2\x80\xa9", "\xe2\x80\xaf", "\xe2\x81\x9f",
            "\xe3\x80\x80",
        };

        // Byte length of the whitespace character starting at s[i], or 0
        static size_t spaceAt(const std::string &s, size_t i)
        {
            if (isSpace(s[i]))
                return 1;
            for (const char *seq : kUnicodeSpaces)
            {
                size_t n = std::char_traits<char>::length(seq);
                if (s.compare(i, n, seq) == 0)
                    return n;
            }
            return 0;
        }

        // Byte length of the whitespace character ending just before s[end], or 0
        static size_t spaceBefore(const std::string &s, size_t end)
        {
            if (isSpace(s[end - 1]))
                return 1;
            for (const char *seq : kUnicodeSpaces)
            {
                size_t n = std::char_traits<char>::length(seq);
                if (end >= n && s.compare(end - n, n, seq) == 0)
                    return n;
            }
            return 0;
        }

        static void checkGrowth(uint64_t inserts, uint64_t bytesEach)
        {
            if (bytesEach != 0 && inserts > kMaxGeneratedLength / bytesEach)
                throw DomainError("replace result grows by more than " +
                                  std::to_string(kMaxGeneratedLength) + " bytes");
        }

        // ====================================================================
        // Truncation
        // ====================================================================

        std::string abbrev(int64_t width, const std::string &s)
        {
            if (width < 4 || s.size() < (uint64_t)width)
                return s;
            return s.substr(0, (size_t)width - 3) + "...";
        }

        std::string abbrevboth(int64_t left, int64_t right, const std::string &s)
        {
            size_t len = s.size();
            size_t offset = std::min((size_t)std::max<int64_t>(left, 0), len);
            size_t maxWidth = std::min((size_t)std::max<int64_t>(right, 0), len);

            if (maxWidth < 4 || (offset > 0 && maxWidth < 7) || len <= maxWidth)
                return s;

            if (offset <= 4)
                return s.substr(0, maxWidth - 3) + "...";

            if (offset + maxWidth - 3 < len)
            {
                size_t end = offset + maxWidth - 6;
                return "..." + s.substr(offset, end - offset) + "...";
            }

            // Window runs off the end: keep the tail
            return "..." + s.substr(len - (maxWidth - 3));
        }

        std::string trunc(int64_t len, const std::string &s)
        {
            if (len < 0 || (uint64_t)len > s.size())
                return s;
            return s.substr(0, (size_t)len);
        }

        std::string substring(int64_t start, int64_t end, const std::string &s)
        {
            uint64_t from = start < 0 ? 0 : (uint64_t)start;
            uint64_t to = end < 0 ? s.size() : (uint64_t)end;
            if (from > to || from > s.size() || to > s.size())
                return s;
            return s.substr((size_t)from, (size_t)(to - from));
        }

        // ====================================================================
        // Case
        // ====================================================================

        std::string initials(const std::string &s)
        {
            std::string out;
            size_t i = 0;
            while (i < s.size())
            {
                while (i < s.size() && isSpace(s[i]))
                    ++i;
                if (i >= s.size())
                    break;
                // Whole first character, so a multi-byte initial stays valid UTF-8
                size_t n = encoding::utf8_sequence_length((unsigned char)s[i]);
                n = std::min(n, s.size() - i);
                out.append(s, i, n);
                while (i < s.size() && !isSpace(s[i]))
                    ++i;
            }
            return out;
        }

        // Apply fn to the first byte of every whitespace-delimited run
        template <typename Fn>
        static std::string mapWordStarts(const std::string &s, Fn fn)
        {
            std::string out = s;
            bool atStart = true;
            for (char &c : out)
            {
                if (isSpace(c))
                {
                    atStart = true;
                }
                else if (atStart)
                {
                    atStart = false;
                    c = (char)fn((unsigned char)c);
                }
            }
            return out;
        }

        std::string untitle(const std::string &s)
        {
            return mapWordStarts(s, [](unsigned char c)
                                 { return std::tolower(c); });
        }

        std::string title(const std::string &s)
        {
            return mapWordStarts(s, [](unsigned char c)
                                 { return std::toupper(c); });
        }

        std::string upper(const std::string &s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return std::toupper(c); });
            return out;
        }

        std::string lower(const std::string &s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return std::tolower(c); });
            return out;
        }

        // ====================================================================
        // Rewriting
        // ====================================================================

        std::string replace(const std::string &oldStr, const std::string &newStr,
                            const std::string &s)
        {
            std::string result;

            // Empty pattern matches before every character and at the end
            if (oldStr.empty())
            {
                uint64_t chars = 0;
                for (size_t i = 0; i < s.size();
                     i += std::min(encoding::utf8_sequence_length((unsigned char)s[i]), s.size() - i))
                    ++chars;
                checkGrowth(chars + 1, newStr.size());

                result = newStr;
                size_t i = 0;
                while (i < s.size())
                {
                    size_t n = std::min(encoding::utf8_sequence_length((unsigned char)s[i]),
                                        s.size() - i);
                    result.append(s, i, n);
                    result += newStr;
                    i += n;
                }
                return result;
            }

            if (newStr.size() > oldStr.size())
            {
                uint64_t matches = 0;
                for (size_t at = s.find(oldStr); at != std::string::npos;
                     at = s.find(oldStr, at + oldStr.size()))
                    ++matches;
                checkGrowth(matches, newStr.size() - oldStr.size());
            }

            size_t start = 0, pos;
            while ((pos = s.find(oldStr, start)) != std::string::npos)
            {
                result.append(s, start, pos - start);
                result += newStr;
                start = pos + oldStr.size();
            }
            result.append(s, start, std::string::npos);
            return result;
        }

        std::string plural(const std::string &one, const std::string &many, int64_t count)
        {
            return count == 1 ? one : many;
        }

        std::string repeat(int64_t count, const std::string &s)
        {
            if (count < 0)
                throw DomainError("repeat count must be non-negative, got " +
                                  std::to_string(count));
            if (s.empty() || count == 0)
                return "";
            if ((uint64_t)count > kMaxGeneratedLength / s.size())
                throw DomainError("repeat result exceeds " +
                                  std::to_string(kMaxGeneratedLength) + " bytes");
            std::string result;
            result.reserve(s.size() * (size_t)count);
            for (int64_t i = 0; i < count; ++i)
                result += s;
            return result;
        }

        std::string nospace(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
            {
                if (!isSpace(c))
                    out += c;
            }
            return out;
        }

        // ====================================================================
        // Lists
        // ====================================================================

        std::string join(const std::string &sep, const Value &list)
        {
            if (!list.isArray())
                throw DomainError("second argument must be of type Array");

            const auto &elems = list.asArray();
            std::string result;
            for (size_t i = 0; i < elems.size(); ++i)
            {
                if (i > 0)
                    result += sep;
                result += elems[i].toString();
            }
            return result;
        }

        StringMap split(const std::string &sep, const std::string &s)
        {
            StringMap result;
            size_t index = 0;
            auto put = [&](std::string piece)
            {
                result.emplace("_" + std::to_string(index++), std::move(piece));
            };

            if (sep.empty())
            {
                // One entry per character, with an empty piece at each end
                put("");
                size_t i = 0;
                while (i < s.size())
                {
                    size_t n = std::min(encoding::utf8_sequence_length((unsigned char)s[i]),
                                        s.size() - i);
                    put(s.substr(i, n));
                    i += n;
                }
                put("");
                return result;
            }

            size_t start = 0, pos;
            while ((pos = s.find(sep, start)) != std::string::npos)
            {
                put(s.substr(start, pos - start));
                start = pos + sep.size();
            }
            put(s.substr(start));
            return result;
        }

        // ====================================================================
        // Trimming
        // ====================================================================

        std::string trim(const std::string &s)
        {
            size_t start = 0, end = s.size();
            size_t n;
            while (start < end && (n = spaceAt(s, start)) != 0)
                start += n;
            while (end > start && (n = spaceBefore(s, end)) != 0 && n <= end - start)
                end -= n;
            return s.substr(start, end - start);
        }

        std::string trimAll(const std::string &chars, const std::string &s)
        {
            auto inSet = [&chars](char c)
            {
                return chars.find(c) != std::string::npos;
            };
            size_t start = 0, end = s.size();
            while (start < end && inSet(s[start]))
                ++start;
            while (end > start && inSet(s[end - 1]))
                --end;
            return s.substr(start, end - start);
        }

        std::string trimSuffix(const std::string &suffix, const std::string &s)
        {
            if (hasSuffix(suffix, s))
                return s.substr(0, s.size() - suffix.size());
            return s;
        }

        std::string trimPrefix(const std::string &prefix, const std::string &s)
        {
            if (hasPrefix(prefix, s))
                return s.substr(prefix.size());
            return s;
        }

        // ====================================================================
        // Predicates
        // ====================================================================

        bool contains(const std::string &substr, const std::string &s)
        {
            return s.find(substr) != std::string::npos;
        }

        bool hasSuffix(const std::string &suffix, const std::string &s)
        {
            return s.size() >= suffix.size() &&
                   s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool hasPrefix(const std::string &prefix, const std::string &s)
        {
            return s.size() >= prefix.size() &&
                   s.compare(0, prefix.size(), prefix) == 0;
        }

    } // namespace text
} // namespace quill
