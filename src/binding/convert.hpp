#pragma once

// =============================================================================
// Conversion traits — Value <-> static C++ types
// =============================================================================
//
//   FromValue<T>::convert(v)  → std::optional<T>   (nullopt = not convertible)
//   FromValue<T>::kind        → name of T for "expected X, got Y" messages
//   ToValue<R>::convert(r)    → Value
//
// Supported parameter types:
//   std::string  ← STRING only
//   int64_t      ← INT, FLOAT (truncated toward zero, range checked)
//   uint64_t     ← INT >= 0, FLOAT (truncated toward zero, range checked)
//   bool         ← BOOL only
//   double       ← INT, FLOAT
//   StringMap    ← MAP whose values are all STRING
//   Value        ← anything (the function inspects the variant itself)
//
// No string <-> number parsing happens here.
// =============================================================================

#include "../value/value.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace quill
{

    /// The static type string-valued maps convert to and from.
    using StringMap = std::map<std::string, std::string>;

    template <typename T>
    struct FromValue; // unsupported parameter types fail to compile here

    template <typename T>
    struct ToValue; // unsupported result types fail to compile here

    // ========================================================================
    // Parameter conversions
    // ========================================================================

    template <>
    struct FromValue<std::string>
    {
        static constexpr const char *kind = "string";

        static std::optional<std::string> convert(const Value &v)
        {
            if (!v.isString())
                return std::nullopt;
            return v.asString();
        }
    };

    template <>
    struct FromValue<int64_t>
    {
        static constexpr const char *kind = "int";

        static std::optional<int64_t> convert(const Value &v)
        {
            if (v.isInt())
                return v.asInt();
            if (!v.isFloat())
                return std::nullopt;
            double d = std::trunc(v.asFloat());
            // [-2^63, 2^63); NaN fails both comparisons
            if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0))
                return std::nullopt;
            return static_cast<int64_t>(d);
        }
    };

    template <>
    struct FromValue<uint64_t>
    {
        static constexpr const char *kind = "unsigned int";

        static std::optional<uint64_t> convert(const Value &v)
        {
            if (v.isInt())
            {
                if (v.asInt() < 0)
                    return std::nullopt;
                return static_cast<uint64_t>(v.asInt());
            }
            if (!v.isFloat())
                return std::nullopt;
            double d = std::trunc(v.asFloat());
            // [0, 2^64); -0.5 truncates to -0.0 which compares equal to 0
            if (!(d >= 0.0 && d < 18446744073709551616.0))
                return std::nullopt;
            return static_cast<uint64_t>(d);
        }
    };

    template <>
    struct FromValue<bool>
    {
        static constexpr const char *kind = "bool";

        static std::optional<bool> convert(const Value &v)
        {
            if (!v.isBool())
                return std::nullopt;
            return v.asBool();
        }
    };

    template <>
    struct FromValue<double>
    {
        static constexpr const char *kind = "float";

        static std::optional<double> convert(const Value &v)
        {
            if (!v.isNumber())
                return std::nullopt;
            return v.asNumber();
        }
    };

    template <>
    struct FromValue<StringMap>
    {
        static constexpr const char *kind = "map of string";

        static std::optional<StringMap> convert(const Value &v)
        {
            if (!v.isMap())
                return std::nullopt;
            StringMap out;
            for (const auto &kv : v.asMap())
            {
                if (!kv.second.isString())
                    return std::nullopt;
                out.emplace(kv.first, kv.second.asString());
            }
            return out;
        }
    };

    template <>
    struct FromValue<Value>
    {
        static constexpr const char *kind = "any";

        static std::optional<Value> convert(const Value &v) { return v; }
    };

    // ========================================================================
    // Result conversions
    // ========================================================================

    template <>
    struct ToValue<std::string>
    {
        static Value convert(std::string s) { return Value::makeString(std::move(s)); }
    };

    template <>
    struct ToValue<bool>
    {
        static Value convert(bool b) { return Value::makeBool(b); }
    };

    template <>
    struct ToValue<int64_t>
    {
        static Value convert(int64_t i) { return Value::makeInt(i); }
    };

    template <>
    struct ToValue<uint64_t>
    {
        // Values above INT64_MAX only fit the FLOAT variant
        static Value convert(uint64_t u)
        {
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return Value::makeFloat(static_cast<double>(u));
            return Value::makeInt(static_cast<int64_t>(u));
        }
    };

    template <>
    struct ToValue<double>
    {
        static Value convert(double d) { return Value::makeFloat(d); }
    };

    template <>
    struct ToValue<StringMap>
    {
        static Value convert(StringMap m)
        {
            ValueMap out;
            for (auto &kv : m)
                out.emplace(kv.first, Value::makeString(std::move(kv.second)));
            return Value::makeMap(std::move(out));
        }
    };

    template <>
    struct ToValue<Value>
    {
        static Value convert(Value v) { return v; }
    };

} // namespace quill
