#pragma once

// =============================================================================
// EvaluationResult — a Value paired with its static type tag
// =============================================================================
//
// The evaluator hands every built-in its arguments as EvaluationResults and
// receives one back. The tag normally mirrors the payload's own type; the
// two-argument constructor exists for callers (the type-checker, boolean
// results) that synthesise the tag themselves.
//
// Coercion rules follow the workflow expression language:
//
//   coerceString   null → ""        bool → "true"/"false"
//                  number → see formatNumber()
//                  string → itself  array → "Array"   object → "Object"
//
//   coerceNumber   null → 0         bool → 1/0        string → parsed, "" → 0
//                  unparsable string, array, object → NaN
//
//   equals         loose equality: mixed primitive types compare as numbers,
//                  strings compare case-insensitively, arrays and objects
//                  only equal themselves
//
// =============================================================================

#include "value.hpp"
#include <string>
#include <utility>

namespace wfexpr
{

    struct EvaluationResult
    {
        Value value;
        ValueType type;

        /// Null result.
        EvaluationResult() : value(Value::makeNull()), type(ValueType::NONE) {}

        /// Tag taken from the payload.
        explicit EvaluationResult(Value v) : value(std::move(v)), type(value.type()) {}

        EvaluationResult(Value v, ValueType t) : value(std::move(v)), type(t) {}

        static EvaluationResult ofBool(bool b)
        {
            return EvaluationResult(Value::makeBool(b), ValueType::BOOL);
        }

        static EvaluationResult ofString(std::string s)
        {
            return EvaluationResult(Value::makeString(std::move(s)), ValueType::STRING);
        }

        /// Null, bool, number or string.
        bool primitive() const { return isPrimitiveType(type); }

        /// Canonical string projection. Never fails.
        std::string coerceString() const;

        /// Numeric projection used by loose equality. Never fails (NaN on
        /// anything that doesn't read as a number).
        double coerceNumber() const;

        /// The element sequence when the tag is ARRAY, nullptr otherwise.
        const ValueArray *coerceSlice() const;

        bool equals(const EvaluationResult &other) const;
    };

    /// Number → string rule shared by coerceString and join.
    std::string formatNumber(double n);

    /// Parses a number the way the expression language reads string operands.
    /// Returns NaN for anything that isn't a complete number.
    double parseNumber(const std::string &text);

    /// ASCII lowercase copy; expression string comparisons ignore case.
    std::string toLowerAscii(const std::string &s);

} // namespace wfexpr
