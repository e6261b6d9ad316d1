#pragma once

// =============================================================================
// Value — the runtime payload of a workflow expression
// =============================================================================
//
// Design:
//   A Value is a lightweight handle (single pointer, 8 bytes) to a
//   heap-allocated control block (ValueData) that holds: reference count,
//   type tag, and a void* to the actual payload.
//
//   Copying a Value is cheap — just a pointer copy + ref count bump.
//   Destruction decrements the ref count; when it hits zero the payload and
//   control block are freed.
//
//   Payloads are immutable once built. Together with the atomic ref count
//   this lets evaluators on different threads share the same Value.
//
// The six shapes form a closed set. Every function that inspects a payload
// switches over ValueType exhaustively.
//
// Memory layout:
//
//   Value  (stack, 8 bytes)
//   ┌──────────┐
//   │  data_*  │──→  ValueData  (heap)
//   └──────────┘     ┌─────────────────────────┐
//                    │ refCount (atomic uint32) │
//                    │ type     (ValueType)     │
//                    │ payload  (void*)         │──→ actual data
//                    └─────────────────────────┘
//
// =============================================================================

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace wfexpr
{

    class Value;

    // ========================================================================
    // ValueType — the type tag enum
    // ========================================================================

    enum class ValueType : uint8_t
    {
        NONE = 0, // null
        BOOL,
        NUMBER, // double
        STRING,
        ARRAY,
        OBJECT,
    };

    /// Human-readable type name for error messages
    const char *valuetype_name(ValueType t);

    /// Null, bool, number and string are primitive; arrays and objects aren't.
    inline bool isPrimitiveType(ValueType t)
    {
        return t != ValueType::ARRAY && t != ValueType::OBJECT;
    }

    // ========================================================================
    // ValueArray, ValueObject — the compound payload types
    // ========================================================================

    /// An ordered sequence of Values
    using ValueArray = std::vector<Value>;

    /// String-keyed mapping. Keys iterate in sorted order.
    using ValueObject = std::map<std::string, Value>;

    // ========================================================================
    // ValueData — the heap-allocated control block
    // ========================================================================

    struct ValueData
    {
        std::atomic<uint32_t> refCount;
        ValueType type;
        void *payload; // points to the type-specific data

        ValueData(ValueType type, void *payload)
            : refCount(1), type(type), payload(payload) {}

        ValueData(const ValueData &) = delete;
        ValueData &operator=(const ValueData &) = delete;
    };

    // ========================================================================
    // Value — the lightweight handle
    // ========================================================================

    class Value
    {
    public:
        // ---- Construction: named factory methods (no implicit conversions) ----

        /// null (payload is nullptr)
        static Value makeNull();

        static Value makeBool(bool value);
        static Value makeNumber(double value);

        static Value makeString(const std::string &value);
        static Value makeString(std::string &&value);

        /// empty array
        static Value makeArray();
        static Value makeArray(ValueArray &&elements);

        /// empty object
        static Value makeObject();
        static Value makeObject(ValueObject &&members);

        // ---- Default constructor → null ----

        Value();

        ~Value();
        Value(const Value &other);
        Value &operator=(const Value &other);
        Value(Value &&other) noexcept;
        Value &operator=(Value &&other) noexcept;

        // ---- Type queries ----

        ValueType type() const;
        bool isNull() const;
        bool isBool() const;
        bool isNumber() const;
        bool isString() const;
        bool isArray() const;
        bool isObject() const;
        bool isPrimitive() const;

        // ---- Payload access (unchecked — caller must verify type first) ----

        bool asBool() const;
        double asNumber() const;
        const std::string &asString() const;
        const ValueArray &asArray() const;
        const ValueObject &asObject() const;

        /// True when both handles point at the same control block.
        bool sameInstance(const Value &other) const { return data_ == other.data_; }

        // ---- Debug: ref count (for testing) ----

        uint32_t refCount() const;

        // ---- Debug: global allocation tracking (for leak detection in tests) ----

        static int64_t liveAllocations();
        static void resetAllocationCounter();

    private:
        ValueData *data_;

        /// Construct from a pre-built ValueData (takes ownership, refCount already 1)
        explicit Value(ValueData *data);

        void retain();
        void release();

        static void freePayload(ValueType type, void *payload);
    };

} // namespace wfexpr
