#pragma once

// =============================================================================
// Binding adapter — static C++ functions as template builtins
// =============================================================================
//
//   std::string abbrev(int64_t width, const std::string &s);
//   t["abbrev"] = bindFunction("abbrev", &text::abbrev);
//
// The returned BuiltinFn, given an ArgumentList:
//   1. checks the argument count                       → ArityError
//   2. downcasts every OpaqueValue to a Value           → DowncastError
//   3. converts every Value with FromValue<T>           → ConvertError
//   4. calls the function with the owned arguments      → DomainError
//   5. wraps the result with ToValue<R> + wrapOpaque
//
// Steps 1-3 finish for every argument before step 4 runs, in position order,
// so the first bad argument is the one reported and the function body never
// sees a partially converted call. The ArgumentList is only read.
// =============================================================================

#include "../builtins/builtin_registry.hpp"
#include "convert.hpp"
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace quill
{

    namespace detail
    {

        template <typename T>
        using param_t = std::remove_cv_t<std::remove_reference_t<T>>;

        /// Downcast + convert one argument, or throw naming its position.
        template <typename T>
        T convertArgument(const std::string &fnName, const ArgumentList &args, size_t i)
        {
            const Value *v = viewOpaque(args[i]);
            if (!v)
                throw DowncastError(fnName, i, describeOpaque(args[i]));

            std::optional<T> converted = FromValue<T>::convert(*v);
            if (!converted)
                throw ConvertError(fnName, i, FromValue<T>::kind, vtype_name(v->type()));
            return std::move(*converted);
        }

        template <typename R, typename... Args, size_t... I>
        OpaqueValue invokeBound(const std::string &fnName,
                                const std::function<R(Args...)> &fn,
                                const ArgumentList &args,
                                std::index_sequence<I...>)
        {
            // Braced init evaluates left to right: position 0 is checked first.
            std::tuple<param_t<Args>...> converted{
                convertArgument<param_t<Args>>(fnName, args, I)...};

            try
            {
                R result = std::apply(fn, std::move(converted));
                return wrapOpaque(ToValue<param_t<R>>::convert(std::move(result)));
            }
            catch (const DomainError &e)
            {
                if (!e.function().empty())
                    throw;
                throw DomainError(fnName, e.detail());
            }
        }

    } // namespace detail

    /// Bind a std::function (lambdas with captures go through here).
    template <typename R, typename... Args>
    BuiltinFn bindFunction(const std::string &name, std::function<R(Args...)> fn)
    {
        return [name, fn = std::move(fn)](const ArgumentList &args) -> OpaqueValue
        {
            if (args.size() != sizeof...(Args))
                throw ArityError(name, sizeof...(Args), args.size());
            return detail::invokeBound(name, fn, args, std::index_sequence_for<Args...>{});
        };
    }

    /// Bind a plain function pointer.
    template <typename R, typename... Args>
    BuiltinFn bindFunction(const std::string &name, R (*fn)(Args...))
    {
        return bindFunction(name, std::function<R(Args...)>(fn));
    }

} // namespace quill
