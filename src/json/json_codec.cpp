#include "json_codec.hpp"
#include "../lib/errors/error.hpp"
#include <cmath>
#include <cstdint>

namespace wfexpr
{

    ValueType getExprType(const nlohmann::json &node, int line)
    {
        switch (node.type())
        {
        case nlohmann::json::value_t::null:
            return ValueType::NONE;
        case nlohmann::json::value_t::boolean:
            return ValueType::BOOL;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return ValueType::NUMBER;
        case nlohmann::json::value_t::string:
            return ValueType::STRING;
        case nlohmann::json::value_t::array:
            return ValueType::ARRAY;
        case nlohmann::json::value_t::object:
            return ValueType::OBJECT;
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
        }
        throw UnsupportedTypeError(node.type_name(), line);
    }

    // Same limit as Go's encoding/json
    static const int kMaxDepth = 10000;

    // `source` is the document text when known, for the depth error
    static Value convertNode(const nlohmann::json &node, int depth,
                             const std::string *source, int line)
    {
        ValueType type = getExprType(node, line);
        if ((type == ValueType::ARRAY || type == ValueType::OBJECT) && depth >= kMaxDepth)
            throw ParseError(source ? *source : node.type_name(), "exceeded max depth", line);

        switch (type)
        {
        case ValueType::NONE:
            return Value::makeNull();
        case ValueType::BOOL:
            return Value::makeBool(node.get<bool>());
        case ValueType::NUMBER:
            return Value::makeNumber(node.get<double>());
        case ValueType::STRING:
            return Value::makeString(node.get<std::string>());
        case ValueType::ARRAY:
        {
            ValueArray elements;
            elements.reserve(node.size());
            for (const auto &elem : node)
                elements.push_back(convertNode(elem, depth + 1, source, line));
            return Value::makeArray(std::move(elements));
        }
        case ValueType::OBJECT:
        {
            ValueObject members;
            for (auto it = node.begin(); it != node.end(); ++it)
                members[it.key()] = convertNode(it.value(), depth + 1, source, line);
            return Value::makeObject(std::move(members));
        }
        }
        return Value::makeNull();
    }

    Value fromJsonNode(const nlohmann::json &node, int line)
    {
        return convertNode(node, 0, nullptr, line);
    }

    Value decodeJson(const std::string &text, int line)
    {
        nlohmann::json node;
        try
        {
            node = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::exception &e)
        {
            // parse_error for bad syntax, out_of_range for numbers that overflow
            throw ParseError(text, e.what(), line);
        }
        return convertNode(node, 0, &text, line);
    }

    nlohmann::json toJsonNode(const Value &value)
    {
        switch (value.type())
        {
        case ValueType::NONE:
            return nullptr;
        case ValueType::BOOL:
            return value.asBool();
        case ValueType::NUMBER:
        {
            double n = value.asNumber();
            // Integral values serialise without a fraction
            if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 9007199254740992.0)
                return static_cast<int64_t>(n);
            return n;
        }
        case ValueType::STRING:
            return value.asString();
        case ValueType::ARRAY:
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &elem : value.asArray())
                arr.push_back(toJsonNode(elem));
            return arr;
        }
        case ValueType::OBJECT:
        {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto &kv : value.asObject())
                obj[kv.first] = toJsonNode(kv.second);
            return obj;
        }
        }
        return nullptr;
    }

    std::string encodeJson(const Value &value, int indent)
    {
        return toJsonNode(value).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace wfexpr
