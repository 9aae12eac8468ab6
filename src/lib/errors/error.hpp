#pragma once

// =============================================================================
// Quill Error Hierarchy
// =============================================================================
// Every error Quill can produce lives here. All inherit from QuillError, which
// inherits from std::runtime_error, so a single `catch (QuillError&)` will
// catch any Quill-specific error. Binding failures additionally carry the
// function name, the argument position and a BindErrorKind tag, so they can
// be handed back to the template evaluator as plain values (see CallResult).
// =============================================================================

#include <stdexcept>
#include <string>

namespace quill
{

    // ========================================================================
    // Base: QuillError
    // ========================================================================
    // Standardised "[QUILL ERROR] Category: message" format.
    // ========================================================================

    class QuillError : public std::runtime_error
    {
    public:
        QuillError(const std::string &category, const std::string &message)
            : std::runtime_error(formatMessage(category, message)),
              category_(category), detail_(message) {}

        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        std::string category_;
        std::string detail_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message)
        {
            return "[QUILL ERROR] " + category + ": " + message;
        }
    };

    // ========================================================================
    // 1. Binding errors — a call could not proceed
    // ========================================================================

    enum class BindErrorKind
    {
        ARITY,        // wrong number of arguments
        DOWNCAST,     // argument is not a template value at all
        CONVERT,      // value variant does not fit the parameter type
        DOMAIN_ERROR, // the function body rejected well-typed input
    };

    /// Human-readable kind name for error messages
    inline const char *bind_error_kind_name(BindErrorKind k)
    {
        switch (k)
        {
        case BindErrorKind::ARITY:
            return "ArityError";
        case BindErrorKind::DOWNCAST:
            return "DowncastError";
        case BindErrorKind::CONVERT:
            return "ConvertError";
        case BindErrorKind::DOMAIN_ERROR:
            return "DomainError";
        }
        return "BindError";
    }

    class BindError : public QuillError
    {
    public:
        BindError(BindErrorKind kind, const std::string &fnName, int position,
                  const std::string &message)
            : QuillError(bind_error_kind_name(kind), message),
              kind_(kind), function_(fnName), position_(position) {}

        BindErrorKind kind() const noexcept { return kind_; }

        /// Name the function was registered under (empty if not yet known).
        const std::string &function() const noexcept { return function_; }

        /// Zero-based argument position, or -1 when the error is not positional.
        int position() const noexcept { return position_; }

    private:
        BindErrorKind kind_;
        std::string function_;
        int position_;
    };

    // ---- 1a. Arity ----------------------------------------------------------

    /// Wrong number of arguments passed to a function.
    class ArityError : public BindError
    {
    public:
        ArityError(const std::string &fnName, size_t expected, size_t got)
            : BindError(BindErrorKind::ARITY, fnName, -1,
                        "'" + fnName + "' expects " + std::to_string(expected) +
                            " arg(s), got " + std::to_string(got)) {}
    };

    // ---- 1b. Downcast -------------------------------------------------------

    /// The opaque handle at `position` does not hold a template value.
    class DowncastError : public BindError
    {
    public:
        DowncastError(const std::string &fnName, size_t position, const std::string &what)
            : BindError(BindErrorKind::DOWNCAST, fnName, (int)position,
                        "'" + fnName + "' argument " + std::to_string(position) +
                            ": unable to downcast " + what + " to a template value") {}
    };

    // ---- 1c. Conversion -----------------------------------------------------

    /// The value at `position` cannot be converted to the parameter type.
    class ConvertError : public BindError
    {
    public:
        ConvertError(const std::string &fnName, size_t position,
                     const std::string &expected, const std::string &actual)
            : BindError(BindErrorKind::CONVERT, fnName, (int)position,
                        "'" + fnName + "' argument " + std::to_string(position) +
                            ": expected " + expected + ", got " + actual) {}
    };

    // ---- 1d. Domain ---------------------------------------------------------

    /// Raised by a function body. The message is kept verbatim in detail();
    /// the adapter re-raises it with the registered function name attached.
    class DomainError : public BindError
    {
    public:
        explicit DomainError(const std::string &message)
            : BindError(BindErrorKind::DOMAIN_ERROR, "", -1, message) {}

        DomainError(const std::string &fnName, const std::string &message)
            : BindError(BindErrorKind::DOMAIN_ERROR, fnName, -1, message) {}
    };

    // ========================================================================
    // 2. Lookup errors
    // ========================================================================

    /// Function name not present in the builtin table.
    class UndefinedFunctionError : public QuillError
    {
    public:
        explicit UndefinedFunctionError(const std::string &name)
            : QuillError("UndefinedFunction", "'" + name + "' is not defined") {}
    };

} // namespace quill
