// =============================================================================
// Value Tests
// =============================================================================
// Verifies the value model and its coercion contracts:
//   - Construction of all six shapes
//   - Reference counting (copy, assign, move, destroy)
//   - Primitive classification
//   - coerceString / coerceNumber / coerceSlice
//   - Loose equality
//   - Leak detection via liveAllocations()
// =============================================================================

#include "../src/value/evaluation_result.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

using namespace wfexpr;

// ---- Minimal test framework ------------------------------------------------

static int g_passed = 0;
static int g_failed = 0;

#define XASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define XASSERT_EQ(a, b)                                 \
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

static EvaluationResult str(const std::string &s) { return EvaluationResult(Value::makeString(s)); }
static EvaluationResult num(double n) { return EvaluationResult(Value::makeNumber(n)); }
static EvaluationResult boolean(bool b) { return EvaluationResult(Value::makeBool(b)); }
static EvaluationResult null() { return EvaluationResult(Value::makeNull()); }

// ============================================================================
// Construction
// ============================================================================

static void testConstruction()
{
    std::cout << "\n===== Construction =====\n";

    runTest("default constructor is null", []()
            {
        Value v;
        XASSERT(v.isNull());
        XASSERT(v.type() == ValueType::NONE); });

    runTest("bool", []()
            {
        Value v = Value::makeBool(true);
        XASSERT(v.isBool());
        XASSERT(v.asBool()); });

    runTest("number", []()
            {
        Value v = Value::makeNumber(2.5);
        XASSERT(v.isNumber());
        XASSERT_EQ(v.asNumber(), 2.5); });

    runTest("string rvalue", []()
            {
        std::string s = "hello";
        Value v = Value::makeString(std::move(s));
        XASSERT(v.isString());
        XASSERT_EQ(v.asString(), std::string("hello")); });

    runTest("array with elements", []()
            {
        ValueArray elems;
        elems.push_back(Value::makeNumber(1));
        elems.push_back(Value::makeString("two"));
        Value v = Value::makeArray(std::move(elems));
        XASSERT(v.isArray());
        XASSERT_EQ(v.asArray().size(), (size_t)2);
        XASSERT_EQ(v.asArray()[1].asString(), std::string("two")); });

    runTest("object keys iterate sorted", []()
            {
        ValueObject members;
        members["zeta"] = Value::makeNumber(1);
        members["alpha"] = Value::makeNumber(2);
        Value v = Value::makeObject(std::move(members));
        XASSERT(v.isObject());
        XASSERT_EQ(v.asObject().begin()->first, std::string("alpha")); });

    runTest("valuetype_name strings", []()
            {
        XASSERT_EQ(std::string(valuetype_name(ValueType::NONE)), std::string("null"));
        XASSERT_EQ(std::string(valuetype_name(ValueType::BOOL)), std::string("bool"));
        XASSERT_EQ(std::string(valuetype_name(ValueType::NUMBER)), std::string("number"));
        XASSERT_EQ(std::string(valuetype_name(ValueType::STRING)), std::string("string"));
        XASSERT_EQ(std::string(valuetype_name(ValueType::ARRAY)), std::string("array"));
        XASSERT_EQ(std::string(valuetype_name(ValueType::OBJECT)), std::string("object")); });

    runTest("primitive classification", []()
            {
        XASSERT(Value().isPrimitive());
        XASSERT(Value::makeBool(false).isPrimitive());
        XASSERT(Value::makeNumber(0).isPrimitive());
        XASSERT(Value::makeString("").isPrimitive());
        XASSERT(!Value::makeArray().isPrimitive());
        XASSERT(!Value::makeObject().isPrimitive()); });

    runTest("result tag follows payload", []()
            {
        XASSERT(EvaluationResult(Value::makeArray()).type == ValueType::ARRAY);
        XASSERT(EvaluationResult().type == ValueType::NONE);
        XASSERT(EvaluationResult::ofBool(true).type == ValueType::BOOL);
        XASSERT(EvaluationResult::ofString("x").type == ValueType::STRING); });
}

// ============================================================================
// Reference counting
// ============================================================================

static void testRefCounting()
{
    std::cout << "\n===== Reference Counting =====\n";

    runTest("initial ref count is 1", []()
            {
        Value v = Value::makeString("x");
        XASSERT_EQ(v.refCount(), (uint32_t)1); });

    runTest("copy increments ref count", []()
            {
        Value a = Value::makeString("x");
        Value b = a;
        XASSERT_EQ(a.refCount(), (uint32_t)2);
        XASSERT(a.sameInstance(b)); });

    runTest("move leaves source empty", []()
            {
        Value a = Value::makeNumber(3);
        Value b = std::move(a);
        XASSERT_EQ(b.refCount(), (uint32_t)1);
        XASSERT_EQ(a.refCount(), (uint32_t)0);
        XASSERT(a.isNull()); });

    runTest("self-assignment is safe", []()
            {
        Value a = Value::makeString("keep");
        Value &ref = a;
        a = ref;
        XASSERT_EQ(a.asString(), std::string("keep"));
        XASSERT_EQ(a.refCount(), (uint32_t)1); });

    runTest("nested values are freed", []()
            {
        Value::resetAllocationCounter();
        {
            ValueArray inner;
            inner.push_back(Value::makeNumber(1));
            ValueObject obj;
            obj["list"] = Value::makeArray(std::move(inner));
            Value v = Value::makeObject(std::move(obj));
            XASSERT(Value::liveAllocations() > 0);
        }
        XASSERT_EQ(Value::liveAllocations(), (int64_t)0); });
}

// ============================================================================
// coerceString
// ============================================================================

static void testCoerceString()
{
    std::cout << "\n===== coerceString =====\n";

    runTest("null is empty", []()
            { XASSERT_EQ(null().coerceString(), std::string("")); });

    runTest("booleans lowercase", []()
            {
        XASSERT_EQ(boolean(true).coerceString(), std::string("true"));
        XASSERT_EQ(boolean(false).coerceString(), std::string("false")); });

    runTest("integral numbers have no decimal point", []()
            {
        XASSERT_EQ(num(3).coerceString(), std::string("3"));
        XASSERT_EQ(num(-12).coerceString(), std::string("-12"));
        XASSERT_EQ(num(0).coerceString(), std::string("0"));
        XASSERT_EQ(num(-0.0).coerceString(), std::string("0")); });

    runTest("fractional numbers", []()
            {
        XASSERT_EQ(num(1.5).coerceString(), std::string("1.5"));
        XASSERT_EQ(num(0.1).coerceString(), std::string("0.1"));
        XASSERT_EQ(num(0.1 + 0.2).coerceString(), std::string("0.3")); });

    runTest("large and tiny numbers use an exponent", []()
            {
        XASSERT_EQ(num(1e20).coerceString(), std::string("1e+20"));
        XASSERT_EQ(num(1e15).coerceString(), std::string("1e+15"));
        XASSERT_EQ(num(1e-7).coerceString(), std::string("1e-07"));
        XASSERT_EQ(num(999999999999999).coerceString(), std::string("999999999999999")); });

    runTest("non-finite numbers", []()
            {
        XASSERT_EQ(num(std::numeric_limits<double>::quiet_NaN()).coerceString(), std::string("NaN"));
        XASSERT_EQ(num(std::numeric_limits<double>::infinity()).coerceString(), std::string("Infinity"));
        XASSERT_EQ(num(-std::numeric_limits<double>::infinity()).coerceString(), std::string("-Infinity")); });

    runTest("string is itself", []()
            { XASSERT_EQ(str("Mixed Case").coerceString(), std::string("Mixed Case")); });

    runTest("array and object names", []()
            {
        XASSERT_EQ(EvaluationResult(Value::makeArray()).coerceString(), std::string("Array"));
        XASSERT_EQ(EvaluationResult(Value::makeObject()).coerceString(), std::string("Object")); });
}

// ============================================================================
// coerceNumber / coerceSlice
// ============================================================================

static void testCoerceNumberAndSlice()
{
    std::cout << "\n===== coerceNumber / coerceSlice =====\n";

    runTest("primitive numbers", []()
            {
        XASSERT_EQ(null().coerceNumber(), 0.0);
        XASSERT_EQ(boolean(true).coerceNumber(), 1.0);
        XASSERT_EQ(boolean(false).coerceNumber(), 0.0);
        XASSERT_EQ(num(4.25).coerceNumber(), 4.25); });

    runTest("string parsing", []()
            {
        XASSERT_EQ(str("").coerceNumber(), 0.0);
        XASSERT_EQ(str("  42 ").coerceNumber(), 42.0);
        XASSERT_EQ(str("-1.5e2").coerceNumber(), -150.0);
        XASSERT_EQ(str("0x1F").coerceNumber(), 31.0);
        XASSERT_EQ(str("0o17").coerceNumber(), 15.0);
        XASSERT(std::isinf(str("Infinity").coerceNumber())); });

    runTest("unparsable strings are NaN", []()
            {
        XASSERT(std::isnan(str("abc").coerceNumber()));
        XASSERT(std::isnan(str("12px").coerceNumber()));
        XASSERT(std::isnan(str("nan").coerceNumber()));
        XASSERT(std::isnan(str("0xZZ").coerceNumber())); });

    runTest("arrays and objects are NaN", []()
            {
        XASSERT(std::isnan(EvaluationResult(Value::makeArray()).coerceNumber()));
        XASSERT(std::isnan(EvaluationResult(Value::makeObject()).coerceNumber())); });

    runTest("coerceSlice on array", []()
            {
        ValueArray elems;
        elems.push_back(Value::makeNumber(1));
        EvaluationResult r(Value::makeArray(std::move(elems)));
        const ValueArray *s = r.coerceSlice();
        XASSERT(s != nullptr);
        XASSERT_EQ(s->size(), (size_t)1); });

    runTest("coerceSlice absent for non-arrays", []()
            {
        XASSERT(str("a,b").coerceSlice() == nullptr);
        XASSERT(null().coerceSlice() == nullptr);
        XASSERT(EvaluationResult(Value::makeObject()).coerceSlice() == nullptr); });

    runTest("coerceSlice honours a synthesised tag", []()
            {
        EvaluationResult r(Value::makeArray(), ValueType::OBJECT);
        XASSERT(r.coerceSlice() == nullptr); });
}

// ============================================================================
// equals
// ============================================================================

static void testEquality()
{
    std::cout << "\n===== Equality =====\n";

    runTest("same type primitives", []()
            {
        XASSERT(null().equals(null()));
        XASSERT(boolean(true).equals(boolean(true)));
        XASSERT(!boolean(true).equals(boolean(false)));
        XASSERT(num(2).equals(num(2.0)));
        XASSERT(!num(2).equals(num(3))); });

    runTest("strings ignore case", []()
            {
        XASSERT(str("Push").equals(str("push")));
        XASSERT(!str("push").equals(str("pull"))); });

    runTest("mixed types compare as numbers", []()
            {
        XASSERT(str("1").equals(num(1)));
        XASSERT(boolean(true).equals(num(1)));
        XASSERT(null().equals(num(0)));
        XASSERT(null().equals(boolean(false)));
        XASSERT(str("").equals(num(0)));
        XASSERT(!str("abc").equals(num(0))); });

    runTest("NaN never equals", []()
            {
        double nan = std::numeric_limits<double>::quiet_NaN();
        XASSERT(!num(nan).equals(num(nan)));
        XASSERT(!str("abc").equals(num(nan))); });

    runTest("containers compare by identity", []()
            {
        Value a = Value::makeArray();
        Value b = Value::makeArray();
        XASSERT(EvaluationResult(a).equals(EvaluationResult(a)));
        XASSERT(!EvaluationResult(a).equals(EvaluationResult(b)));
        XASSERT(!EvaluationResult(a).equals(str("Array"))); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    testConstruction();
    testRefCounting();
    testCoerceString();
    testCoerceNumberAndSlice();
    testEquality();

    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << "\n";
    std::cout << "============================================\n";

    return g_failed == 0 ? 0 : 1;
}
