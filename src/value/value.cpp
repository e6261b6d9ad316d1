#include "value.hpp"
#include <atomic>

namespace wfexpr
{

    // ========================================================================
    // Global allocation counter (debug / test only)
    // ========================================================================

    static std::atomic<int64_t> g_liveAllocs{0};

    int64_t Value::liveAllocations() { return g_liveAllocs.load(std::memory_order_relaxed); }
    void Value::resetAllocationCounter() { g_liveAllocs.store(0, std::memory_order_relaxed); }

    // ========================================================================
    // valuetype_name — human-readable type tag
    // ========================================================================

    const char *valuetype_name(ValueType t)
    {
        switch (t)
        {
        case ValueType::NONE:
            return "null";
        case ValueType::BOOL:
            return "bool";
        case ValueType::NUMBER:
            return "number";
        case ValueType::STRING:
            return "string";
        case ValueType::ARRAY:
            return "array";
        case ValueType::OBJECT:
            return "object";
        }
        return "unknown";
    }

    // ========================================================================
    // Payload allocation helpers (raw new/delete, tracked)
    // ========================================================================

    static ValueData *allocData(ValueType type, void *payload)
    {
        g_liveAllocs.fetch_add(1, std::memory_order_relaxed);
        return new ValueData(type, payload);
    }

    void Value::freePayload(ValueType type, void *payload)
    {
        if (!payload)
            return;

        switch (type)
        {
        case ValueType::NONE:
            break; // no payload
        case ValueType::BOOL:
            delete static_cast<bool *>(payload);
            break;
        case ValueType::NUMBER:
            delete static_cast<double *>(payload);
            break;
        case ValueType::STRING:
            delete static_cast<std::string *>(payload);
            break;
        case ValueType::ARRAY:
            delete static_cast<ValueArray *>(payload);
            break;
        case ValueType::OBJECT:
            delete static_cast<ValueObject *>(payload);
            break;
        }
    }

    // ========================================================================
    // Factory methods
    // ========================================================================

    Value Value::makeNull()
    {
        return Value(allocData(ValueType::NONE, nullptr));
    }

    Value Value::makeBool(bool value)
    {
        bool *p = new bool(value);
        return Value(allocData(ValueType::BOOL, p));
    }

    Value Value::makeNumber(double value)
    {
        double *p = new double(value);
        return Value(allocData(ValueType::NUMBER, p));
    }

    Value Value::makeString(const std::string &value)
    {
        std::string *p = new std::string(value);
        return Value(allocData(ValueType::STRING, p));
    }

    Value Value::makeString(std::string &&value)
    {
        std::string *p = new std::string(std::move(value));
        return Value(allocData(ValueType::STRING, p));
    }

    Value Value::makeArray()
    {
        ValueArray *p = new ValueArray();
        return Value(allocData(ValueType::ARRAY, p));
    }

    Value Value::makeArray(ValueArray &&elements)
    {
        ValueArray *p = new ValueArray(std::move(elements));
        return Value(allocData(ValueType::ARRAY, p));
    }

    Value Value::makeObject()
    {
        ValueObject *p = new ValueObject();
        return Value(allocData(ValueType::OBJECT, p));
    }

    Value Value::makeObject(ValueObject &&members)
    {
        ValueObject *p = new ValueObject(std::move(members));
        return Value(allocData(ValueType::OBJECT, p));
    }

    // ========================================================================
    // Default constructor → null
    // ========================================================================

    Value::Value()
        : data_(allocData(ValueType::NONE, nullptr)) {}

    Value::Value(ValueData *data)
        : data_(data) {}

    // ========================================================================
    // Ref counting
    // ========================================================================

    void Value::retain()
    {
        if (data_)
            data_->refCount.fetch_add(1, std::memory_order_relaxed);
    }

    void Value::release()
    {
        if (!data_)
            return;

        if (data_->refCount.fetch_sub(1, std::memory_order_acq_rel) == 1)
        {
            // Old value was 1 → now 0, we own the last reference
            freePayload(data_->type, data_->payload);
            delete data_;
            g_liveAllocs.fetch_sub(1, std::memory_order_relaxed);
        }
        data_ = nullptr;
    }

    uint32_t Value::refCount() const
    {
        return data_ ? data_->refCount.load(std::memory_order_relaxed) : 0;
    }

    // ========================================================================
    // Big Five
    // ========================================================================

    Value::~Value()
    {
        release();
    }

    Value::Value(const Value &other)
        : data_(other.data_)
    {
        retain();
    }

    Value &Value::operator=(const Value &other)
    {
        if (this != &other)
        {
            release();
            data_ = other.data_;
            retain();
        }
        return *this;
    }

    Value::Value(Value &&other) noexcept
        : data_(other.data_)
    {
        other.data_ = nullptr;
    }

    Value &Value::operator=(Value &&other) noexcept
    {
        if (this != &other)
        {
            release();
            data_ = other.data_;
            other.data_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Type queries
    // ========================================================================

    // A moved-from handle reads as null.
    ValueType Value::type() const { return data_ ? data_->type : ValueType::NONE; }
    bool Value::isNull() const { return type() == ValueType::NONE; }
    bool Value::isBool() const { return type() == ValueType::BOOL; }
    bool Value::isNumber() const { return type() == ValueType::NUMBER; }
    bool Value::isString() const { return type() == ValueType::STRING; }
    bool Value::isArray() const { return type() == ValueType::ARRAY; }
    bool Value::isObject() const { return type() == ValueType::OBJECT; }
    bool Value::isPrimitive() const { return isPrimitiveType(type()); }

    // ========================================================================
    // Payload access (unchecked — caller must verify type)
    // ========================================================================

    bool Value::asBool() const
    {
        return *static_cast<bool *>(data_->payload);
    }

    double Value::asNumber() const
    {
        return *static_cast<double *>(data_->payload);
    }

    const std::string &Value::asString() const
    {
        return *static_cast<std::string *>(data_->payload);
    }

    const ValueArray &Value::asArray() const
    {
        return *static_cast<ValueArray *>(data_->payload);
    }

    const ValueObject &Value::asObject() const
    {
        return *static_cast<ValueObject *>(data_->payload);
    }

} // namespace wfexpr
