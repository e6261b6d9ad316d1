#include "evaluation_result.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace wfexpr
{

    // ========================================================================
    // Helpers
    // ========================================================================

    std::string toLowerAscii(const std::string &s)
    {
        std::string out = s;
        for (auto &c : out)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    std::string formatNumber(double n)
    {
        if (std::isnan(n))
            return "NaN";
        if (std::isinf(n))
            return n > 0 ? "Infinity" : "-Infinity";

        // Integers print without decimal point until they need an exponent
        if (n == std::floor(n) && std::fabs(n) < 1e15)
            return std::to_string(static_cast<long long>(n));

        // Exponents come out as iostreams writes them: 1e+20, 1e-07
        std::ostringstream oss;
        oss << std::setprecision(15) << n;
        return oss.str();
    }

    static double parseRadix(const std::string &digits, int base)
    {
        if (digits.empty())
            return std::numeric_limits<double>::quiet_NaN();
        for (char c : digits)
        {
            bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                                 : (c >= '0' && c <= '7');
            if (!ok)
                return std::numeric_limits<double>::quiet_NaN();
        }
        errno = 0;
        unsigned long long v = std::strtoull(digits.c_str(), nullptr, base);
        if (errno == ERANGE)
            return std::numeric_limits<double>::infinity();
        return static_cast<double>(v);
    }

    double parseNumber(const std::string &text)
    {
        size_t start = 0, end = text.size();
        while (start < end && std::isspace(static_cast<unsigned char>(text[start])))
            ++start;
        while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
            --end;
        std::string s = text.substr(start, end - start);

        if (s.empty())
            return 0.0;

        if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
            return parseRadix(s.substr(2), 16);
        if (s.size() > 2 && s[0] == '0' && (s[1] == 'o' || s[1] == 'O'))
            return parseRadix(s.substr(2), 8);

        if (s == "Infinity" || s == "+Infinity")
            return std::numeric_limits<double>::infinity();
        if (s == "-Infinity")
            return -std::numeric_limits<double>::infinity();

        // strtod also accepts "nan", "inf" and hex floats; only plain
        // decimal notation is a number here.
        bool sawDigit = false;
        for (char c : s)
        {
            if (std::isdigit(static_cast<unsigned char>(c)))
                sawDigit = true;
            else if (c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-')
                return std::numeric_limits<double>::quiet_NaN();
        }
        if (!sawDigit)
            return std::numeric_limits<double>::quiet_NaN();

        char *stop = nullptr;
        double v = std::strtod(s.c_str(), &stop);
        if (stop != s.c_str() + s.size())
            return std::numeric_limits<double>::quiet_NaN();
        return v;
    }

    // ========================================================================
    // Coercions
    // ========================================================================

    std::string EvaluationResult::coerceString() const
    {
        switch (value.type())
        {
        case ValueType::NONE:
            return "";
        case ValueType::BOOL:
            return value.asBool() ? "true" : "false";
        case ValueType::NUMBER:
            return formatNumber(value.asNumber());
        case ValueType::STRING:
            return value.asString();
        case ValueType::ARRAY:
            return "Array";
        case ValueType::OBJECT:
            return "Object";
        }
        return "";
    }

    double EvaluationResult::coerceNumber() const
    {
        switch (value.type())
        {
        case ValueType::NONE:
            return 0.0;
        case ValueType::BOOL:
            return value.asBool() ? 1.0 : 0.0;
        case ValueType::NUMBER:
            return value.asNumber();
        case ValueType::STRING:
            return parseNumber(value.asString());
        case ValueType::ARRAY:
        case ValueType::OBJECT:
            return std::numeric_limits<double>::quiet_NaN();
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    const ValueArray *EvaluationResult::coerceSlice() const
    {
        if (type != ValueType::ARRAY || !value.isArray())
            return nullptr;
        return &value.asArray();
    }

    // ========================================================================
    // Equality
    // ========================================================================

    bool EvaluationResult::equals(const EvaluationResult &other) const
    {
        ValueType a = value.type();
        ValueType b = other.value.type();

        // Arrays and objects compare by identity
        if (!isPrimitiveType(a) || !isPrimitiveType(b))
            return value.sameInstance(other.value);

        if (a != b)
            return coerceNumber() == other.coerceNumber(); // NaN != NaN

        switch (a)
        {
        case ValueType::NONE:
            return true;
        case ValueType::BOOL:
            return value.asBool() == other.value.asBool();
        case ValueType::NUMBER:
            return value.asNumber() == other.value.asNumber();
        case ValueType::STRING:
            return toLowerAscii(value.asString()) == toLowerAscii(other.value.asString());
        case ValueType::ARRAY:
        case ValueType::OBJECT:
            break;
        }
        return false;
    }

} // namespace wfexpr
