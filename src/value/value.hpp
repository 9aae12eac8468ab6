#pragma once

// =============================================================================
// Value — the dynamic template value
// =============================================================================
//
// Design:
//   Every template value at runtime is a Value. A Value is a lightweight
//   handle (single pointer, 8 bytes) to a heap-allocated control block (VData)
//   that holds: reference count, type tag, and a void* to the actual payload.
//
//   Copying a Value is a pointer copy + ref count bump. Destruction
//   decrements the ref count; when it hits zero the payload and control block
//   are freed. Payloads are never mutated after construction, so a Value can
//   be shared freely between threads.
//
// Memory layout:
//
//   Value  (stack, 8 bytes)
//   ┌──────────┐
//   │  data_*  │──→  VData  (heap)
//   └──────────┘     ┌─────────────────────────┐
//                    │ refCount (atomic uint32) │
//                    │ type     (VType)         │
//                    │ payload  (void*)         │──→ actual data
//                    └─────────────────────────┘
//
// =============================================================================

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace quill
{

    class Value;

    // ========================================================================
    // VType — the type tag enum
    // ========================================================================

    enum class VType : uint8_t
    {
        NIL = 0,
        BOOL,
        INT,    // int64_t
        FLOAT,  // double
        STRING, // std::string (bytes, normally UTF-8)
        ARRAY,  // ValueArray
        MAP,    // ValueMap
    };

    /// Human-readable type name for error messages
    const char *vtype_name(VType t);

    /// An ordered sequence of Values
    using ValueArray = std::vector<Value>;

    /// String-keyed map of Values (keys kept sorted for stable rendering)
    using ValueMap = std::map<std::string, Value>;

    // ========================================================================
    // VData — the heap-allocated control block
    // ========================================================================

    struct VData
    {
        std::atomic<uint32_t> refCount;
        VType type;
        void *payload; // points to the type-specific data

        VData(VType type, void *payload)
            : refCount(1), type(type), payload(payload) {}

        VData(const VData &) = delete;
        VData &operator=(const VData &) = delete;
    };

    // ========================================================================
    // Value — the lightweight value handle
    // ========================================================================

    class Value
    {
    public:
        // ---- Construction: named factory methods (no implicit conversions) ----

        static Value makeNil();
        static Value makeBool(bool value);
        static Value makeInt(int64_t value);
        static Value makeFloat(double value);

        static Value makeString(const std::string &value);
        static Value makeString(std::string &&value);

        /// empty array
        static Value makeArray();
        /// array from existing vector
        static Value makeArray(ValueArray &&elements);

        /// empty map
        static Value makeMap();
        /// map from existing ValueMap
        static Value makeMap(ValueMap &&entries);

        // ---- Default constructor → nil ----

        Value();

        // ---- Big Five: ref-counted copy/move ----

        ~Value();
        Value(const Value &other);
        Value &operator=(const Value &other);
        Value(Value &&other) noexcept;
        Value &operator=(Value &&other) noexcept;

        // ---- Type queries ----

        VType type() const;
        bool isNil() const;
        bool isBool() const;
        bool isInt() const;
        bool isFloat() const;
        bool isNumber() const; // true for INT or FLOAT
        bool isString() const;
        bool isArray() const;
        bool isMap() const;

        // ---- Payload access (unchecked, caller must verify type first) ----

        bool asBool() const;
        int64_t asInt() const;
        double asFloat() const;
        double asNumber() const; // INT or FLOAT widened to double
        const std::string &asString() const;
        const ValueArray &asArray() const;
        const ValueMap &asMap() const;

        // ---- Rendering (what a template prints for this value) ----
        //   nil → "<no value>", string → raw bytes, array → "[a b]",
        //   map → "map[k:v]" in key order

        std::string toString() const;

        // ---- Structural comparison ----
        //   arrays element-wise in order, maps as unordered key/value sets,
        //   INT and FLOAT numerically, any other variant mismatch is unequal

        bool equals(const Value &other) const;

        // ---- Debug: ref count (for testing) ----

        uint32_t refCount() const;

        // ---- Debug: global allocation tracking (for leak detection in tests) ----

        static int64_t liveAllocations();
        static void resetAllocationCounter();

    private:
        VData *data_;

        /// Construct from a pre-built VData (takes ownership, refCount already 1)
        explicit Value(VData *data);

        void retain();
        void release();

        /// Free the payload based on type
        static void freePayload(VType type, void *payload);
    };

} // namespace quill
