// =============================================================================
// Binding Tests
// =============================================================================
// Exercises the adapter that turns statically typed C++ functions into
// BuiltinFns: arity checks, downcasts, per-type conversion rules, domain
// failures, result wrapping, and the guarantee that the function body never
// runs when any argument is bad.
// =============================================================================

#include "../src/binding/adapter.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace quill;

// ---- Minimal test framework ------------------------------------------------

static int g_passed = 0;
static int g_failed = 0;

static void runTest(const std::string &name, std::function<void()> fn)
{
    try
    {
        fn();
        std::cout << "  PASS: " << name << "\n";
        g_passed++;
    }
    catch (const std::exception &e)
    {
        std::cout << "  FAIL: " << name << "\n        " << e.what() << "\n";
        g_failed++;
    }
}

#define QASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define QASSERT_EQ(a, b)                                 \
    do                                                   \
    {                                                    \
        if ((a) != (b))                                  \
        {                                                \
            std::ostringstream os;                       \
            os << "Expected [" << (a) << "] == [" << (b) \
               << "] (line " << __LINE__ << ")";         \
            throw std::runtime_error(os.str());          \
        }                                                \
    } while (0)

// ---- Argument helpers -------------------------------------------------------

static OpaqueValue arg(const char *s) { return wrapOpaque(Value::makeString(s)); }
static OpaqueValue arg(int64_t i) { return wrapOpaque(Value::makeInt(i)); }
static OpaqueValue arg(int i) { return wrapOpaque(Value::makeInt(i)); }
static OpaqueValue arg(double d) { return wrapOpaque(Value::makeFloat(d)); }
static OpaqueValue arg(bool b) { return wrapOpaque(Value::makeBool(b)); }

static Value resultOf(const CallResult &r)
{
    if (!r.ok())
        throw std::runtime_error(std::string("call failed: ") + r.error().what());
    return *viewOpaque(r.value());
}

// ---- Functions under test ----------------------------------------------------

static int g_bodyCalls = 0;

static std::string repeatWord(int64_t n, const std::string &word)
{
    g_bodyCalls++;
    std::string out;
    for (int64_t i = 0; i < n; ++i)
        out += word;
    return out;
}

static uint64_t passUnsigned(uint64_t n) { return n; }
static int64_t passSigned(int64_t n) { return n; }
static bool negate(bool b) { return !b; }
static double half(double d) { return d / 2; }

static StringMap swapMap(StringMap m)
{
    StringMap out;
    for (const auto &kv : m)
        out.emplace(kv.second, kv.first);
    return out;
}

static std::string kindOf(const Value &v) { return vtype_name(v.type()); }

static std::string alwaysFails(const std::string &)
{
    throw DomainError("payload rejected");
}

static std::string noArgs() { return "constant"; }

// ============================================================================
// Section 1: Arity
// ============================================================================

static void testArity()
{
    std::cout << "\n===== Arity =====\n";

    BuiltinFn fn = bindFunction("repeatWord", &repeatWord);

    runTest("too few arguments", [fn]()
            {
        auto r = callBuiltin(fn, {arg(2)});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::ARITY);
        QASSERT_EQ(r.error().detail(), std::string("'repeatWord' expects 2 arg(s), got 1")); });

    runTest("too many arguments", [fn]()
            {
        auto r = callBuiltin(fn, {arg(2), arg("a"), arg("b")});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::ARITY); });

    runTest("zero-arity function", []()
            {
        BuiltinFn constant = bindFunction("noArgs", &noArgs);
        QASSERT_EQ(resultOf(callBuiltin(constant, {})).asString(), std::string("constant"));
        QASSERT(!callBuiltin(constant, {arg(1)}).ok()); });

    runTest("exact arity succeeds", [fn]()
            {
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(3), arg("ab")})).asString(),
                   std::string("ababab")); });
}

// ============================================================================
// Section 2: Downcast
// ============================================================================

static void testDowncast()
{
    std::cout << "\n===== Downcast =====\n";

    BuiltinFn fn = bindFunction("repeatWord", &repeatWord);

    runTest("foreign payload fails with position", [fn]()
            {
        OpaqueValue foreign = std::make_shared<std::any>(std::string("not a Value"));
        auto r = callBuiltin(fn, {arg(1), foreign});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::DOWNCAST);
        QASSERT_EQ(r.error().position(), 1);
        QASSERT_EQ(r.error().function(), std::string("repeatWord")); });

    runTest("null handle fails", [fn]()
            {
        auto r = callBuiltin(fn, {OpaqueValue(), arg("x")});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::DOWNCAST);
        QASSERT_EQ(r.error().position(), 0); });
}

// ============================================================================
// Section 3: Conversion rules
// ============================================================================

static void testConversion()
{
    std::cout << "\n===== Conversion =====\n";

    runTest("string parameter rejects int", []()
            {
        auto r = callBuiltin(bindFunction("repeatWord", &repeatWord), {arg(1), arg(5)});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::CONVERT);
        QASSERT_EQ(r.error().position(), 1);
        QASSERT_EQ(r.error().detail(), std::string("'repeatWord' argument 1: expected string, got int")); });

    runTest("int parameter rejects numeric string", []()
            {
        auto r = callBuiltin(bindFunction("passSigned", &passSigned), {arg("42")});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::CONVERT); });

    runTest("int parameter truncates float toward zero", []()
            {
        BuiltinFn fn = bindFunction("passSigned", &passSigned);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(3.9)})).asInt(), (int64_t)3);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(-3.9)})).asInt(), (int64_t)-3); });

    runTest("int parameter rejects out-of-range float", []()
            {
        BuiltinFn fn = bindFunction("passSigned", &passSigned);
        QASSERT(!callBuiltin(fn, {arg(1e19)}).ok());
        QASSERT(!callBuiltin(fn, {arg(std::nan(""))}).ok());
        QASSERT(!callBuiltin(fn, {arg(std::numeric_limits<double>::infinity())}).ok()); });

    runTest("unsigned parameter rejects negatives", []()
            {
        BuiltinFn fn = bindFunction("passUnsigned", &passUnsigned);
        auto r = callBuiltin(fn, {arg(-1)});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::CONVERT);
        QASSERT(!callBuiltin(fn, {arg(-1.5)}).ok());
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(-0.5)})).asInt(), (int64_t)0);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(7.2)})).asInt(), (int64_t)7); });

    runTest("unsigned result above INT64_MAX becomes float", []()
            {
        BuiltinFn fn = bindFunction("passUnsigned", &passUnsigned);
        const Value &v = resultOf(callBuiltin(fn, {arg(1.5e19)}));
        QASSERT(v.isFloat());
        QASSERT_EQ(v.asFloat(), 1.5e19); });

    runTest("bool parameter accepts only bool", []()
            {
        BuiltinFn fn = bindFunction("negate", &negate);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(true)})).asBool(), false);
        QASSERT(!callBuiltin(fn, {arg(1)}).ok());
        QASSERT(!callBuiltin(fn, {arg("true")}).ok()); });

    runTest("float parameter widens int", []()
            {
        BuiltinFn fn = bindFunction("half", &half);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(3)})).asFloat(), 1.5); });

    runTest("string map converts and wraps", []()
            {
        ValueMap m;
        m.emplace("a", Value::makeString("x"));
        m.emplace("b", Value::makeString("y"));
        BuiltinFn fn = bindFunction("swapMap", &swapMap);
        const Value &v = resultOf(callBuiltin(fn, {wrapOpaque(Value::makeMap(std::move(m)))}));
        QASSERT(v.isMap());
        QASSERT_EQ(v.asMap().at("x").asString(), std::string("a"));
        QASSERT_EQ(v.asMap().at("y").asString(), std::string("b")); });

    runTest("string map rejects non-string values", []()
            {
        ValueMap m;
        m.emplace("a", Value::makeInt(1));
        auto r = callBuiltin(bindFunction("swapMap", &swapMap),
                             {wrapOpaque(Value::makeMap(std::move(m)))});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::CONVERT);
        QASSERT_EQ(r.error().detail(), std::string("'swapMap' argument 0: expected map of string, got map")); });

    runTest("Value parameter passes any variant", []()
            {
        BuiltinFn fn = bindFunction("kindOf", &kindOf);
        QASSERT_EQ(resultOf(callBuiltin(fn, {wrapOpaque(Value::makeNil())})).asString(), std::string("nil"));
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg(2.0)})).asString(), std::string("float")); });
}

// ============================================================================
// Section 4: Invocation & failure ordering
// ============================================================================

static void testInvocation()
{
    std::cout << "\n===== Invocation =====\n";

    runTest("body never runs when an argument is bad", []()
            {
        BuiltinFn fn = bindFunction("repeatWord", &repeatWord);
        g_bodyCalls = 0;
        QASSERT(!callBuiltin(fn, {arg(2), arg(false)}).ok());
        QASSERT(!callBuiltin(fn, {arg("x"), arg("y")}).ok());
        QASSERT(!callBuiltin(fn, {arg(1)}).ok());
        QASSERT_EQ(g_bodyCalls, 0);
        QASSERT(callBuiltin(fn, {arg(1), arg("y")}).ok());
        QASSERT_EQ(g_bodyCalls, 1); });

    runTest("first bad position is reported", []()
            {
        auto r = callBuiltin(bindFunction("repeatWord", &repeatWord), {arg("x"), arg(3)});
        QASSERT(!r.ok());
        QASSERT_EQ(r.error().position(), 0); });

    runTest("domain failure keeps message and gains function name", []()
            {
        auto r = callBuiltin(bindFunction("alwaysFails", &alwaysFails), {arg("x")});
        QASSERT(!r.ok());
        QASSERT(r.error().kind() == BindErrorKind::DOMAIN_ERROR);
        QASSERT_EQ(r.error().detail(), std::string("payload rejected"));
        QASSERT_EQ(r.error().function(), std::string("alwaysFails")); });

    runTest("arguments are not modified", []()
            {
        ArgumentList args{arg(2), arg("ab")};
        const Value *before = viewOpaque(args[1]);
        auto r = callBuiltin(bindFunction("repeatWord", &repeatWord), args);
        QASSERT(r.ok());
        QASSERT(viewOpaque(args[1]) == before);
        QASSERT_EQ(before->asString(), std::string("ab")); });

    runTest("std::function with captures binds", []()
            {
        std::string suffix = "!";
        std::function<std::string(const std::string &)> shout =
            [suffix](const std::string &s) { return s + suffix; };
        BuiltinFn fn = bindFunction("shout", shout);
        QASSERT_EQ(resultOf(callBuiltin(fn, {arg("hey")})).asString(), std::string("hey!")); });

    runTest("each call returns a fresh box", []()
            {
        BuiltinFn fn = bindFunction("noArgs", &noArgs);
        auto a = callBuiltin(fn, {});
        auto b = callBuiltin(fn, {});
        QASSERT(a.value() != b.value());
        QASSERT(viewOpaque(a.value())->equals(*viewOpaque(b.value()))); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    testArity();
    testDowncast();
    testConversion();
    testInvocation();

    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << "\n";
    std::cout << "============================================\n";

    return g_failed == 0 ? 0 : 1;
}
