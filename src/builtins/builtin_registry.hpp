#pragma once

// =============================================================================
// Builtin Registry — central type definitions for Quill template functions
// =============================================================================
//
// Every function category (encoding, string, random, …) registers its
// functions into a  BuiltinTable  (unordered_map<string, BuiltinFn>).
// Functions are written against static C++ types and turned into BuiltinFns
// by  bindFunction()  (see ../binding/adapter.hpp).
//
// To add a new category of builtins:
//   1. Create  src/builtins/builtins_<category>.hpp
//   2. Write a free function:
//          void registerXxxBuiltins(BuiltinTable &t, <optional captures>);
//   3. Call it from  register_all.hpp → registerAllBuiltins().
//
// Calling convention for the template evaluator:
//     CallResult r = callBuiltin(table, "abbrev", args);
//     if (r.ok()) use(r.value()); else report(r.error());
//
// =============================================================================

#include "../lib/errors/error.hpp"
#include "../value/opaque.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace quill
{

    /// Signature every bound function has. Throws BindError on failure.
    using BuiltinFn = std::function<OpaqueValue(const ArgumentList &args)>;

    /// The table the template engine owns; categories insert into it.
    using BuiltinTable = std::unordered_map<std::string, BuiltinFn>;

    // ========================================================================
    // CallResult — a call outcome carried by value
    // ========================================================================

    class CallResult
    {
    public:
        static CallResult success(OpaqueValue value)
        {
            CallResult r;
            r.value_ = std::move(value);
            return r;
        }

        static CallResult failure(const BindError &error)
        {
            CallResult r;
            r.error_.emplace(error);
            return r;
        }

        bool ok() const noexcept { return !error_.has_value(); }

        /// The wrapped result (null handle when !ok()).
        const OpaqueValue &value() const noexcept { return value_; }

        /// The failure. Only valid when !ok().
        const BindError &error() const { return *error_; }

    private:
        CallResult() = default;

        OpaqueValue value_;
        std::optional<BindError> error_;
    };

    /// Invoke a bound function, turning any BindError into a failed result.
    inline CallResult callBuiltin(const BuiltinFn &fn, const ArgumentList &args)
    {
        try
        {
            return CallResult::success(fn(args));
        }
        catch (const BindError &e)
        {
            return CallResult::failure(e);
        }
    }

    /// Resolve a function name. Throws UndefinedFunctionError if absent.
    inline const BuiltinFn &lookupBuiltin(const BuiltinTable &t, const std::string &name)
    {
        auto it = t.find(name);
        if (it == t.end())
            throw UndefinedFunctionError(name);
        return it->second;
    }

    /// lookupBuiltin + callBuiltin
    inline CallResult callBuiltin(const BuiltinTable &t, const std::string &name,
                                  const ArgumentList &args)
    {
        return callBuiltin(lookupBuiltin(t, name), args);
    }

} // namespace quill
