#include "value.hpp"
#include <cmath>
#include <sstream>

namespace quill
{

    // ========================================================================
    // Global allocation counter (debug / test only)
    // ========================================================================

    static std::atomic<int64_t> g_liveAllocs{0};

    int64_t Value::liveAllocations() { return g_liveAllocs.load(std::memory_order_relaxed); }
    void Value::resetAllocationCounter() { g_liveAllocs.store(0, std::memory_order_relaxed); }

    // ========================================================================
    // vtype_name — human-readable type tag
    // ========================================================================

    const char *vtype_name(VType t)
    {
        switch (t)
        {
        case VType::NIL:
            return "nil";
        case VType::BOOL:
            return "bool";
        case VType::INT:
            return "int";
        case VType::FLOAT:
            return "float";
        case VType::STRING:
            return "string";
        case VType::ARRAY:
            return "array";
        case VType::MAP:
            return "map";
        }
        return "unknown";
    }

    // ========================================================================
    // Payload allocation helpers
    // ========================================================================

    static VData *allocData(VType type, void *payload)
    {
        g_liveAllocs.fetch_add(1, std::memory_order_relaxed);
        return new VData(type, payload);
    }

    void Value::freePayload(VType type, void *payload)
    {
        if (!payload)
            return;

        switch (type)
        {
        case VType::NIL:
            break;
        case VType::BOOL:
            delete static_cast<bool *>(payload);
            break;
        case VType::INT:
            delete static_cast<int64_t *>(payload);
            break;
        case VType::FLOAT:
            delete static_cast<double *>(payload);
            break;
        case VType::STRING:
            delete static_cast<std::string *>(payload);
            break;
        case VType::ARRAY:
            delete static_cast<ValueArray *>(payload);
            break;
        case VType::MAP:
            delete static_cast<ValueMap *>(payload);
            break;
        }
    }

    // ========================================================================
    // Factory methods
    // ========================================================================

    Value Value::makeNil()
    {
        return Value(allocData(VType::NIL, nullptr));
    }

    Value Value::makeBool(bool value)
    {
        return Value(allocData(VType::BOOL, new bool(value)));
    }

    Value Value::makeInt(int64_t value)
    {
        return Value(allocData(VType::INT, new int64_t(value)));
    }

    Value Value::makeFloat(double value)
    {
        return Value(allocData(VType::FLOAT, new double(value)));
    }

    Value Value::makeString(const std::string &value)
    {
        return Value(allocData(VType::STRING, new std::string(value)));
    }

    Value Value::makeString(std::string &&value)
    {
        return Value(allocData(VType::STRING, new std::string(std::move(value))));
    }

    Value Value::makeArray()
    {
        return Value(allocData(VType::ARRAY, new ValueArray()));
    }

    Value Value::makeArray(ValueArray &&elements)
    {
        return Value(allocData(VType::ARRAY, new ValueArray(std::move(elements))));
    }

    Value Value::makeMap()
    {
        return Value(allocData(VType::MAP, new ValueMap()));
    }

    Value Value::makeMap(ValueMap &&entries)
    {
        return Value(allocData(VType::MAP, new ValueMap(std::move(entries))));
    }

    // ========================================================================
    // Constructors / ref counting
    // ========================================================================

    Value::Value()
        : data_(allocData(VType::NIL, nullptr)) {}

    Value::Value(VData *data)
        : data_(data) {}

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
            freePayload(data_->type, data_->payload);
            delete data_;
            g_liveAllocs.fetch_sub(1, std::memory_order_relaxed);
        }
        data_ = nullptr;
    }

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

    VType Value::type() const { return data_ ? data_->type : VType::NIL; }
    bool Value::isNil() const { return type() == VType::NIL; }
    bool Value::isBool() const { return type() == VType::BOOL; }
    bool Value::isInt() const { return type() == VType::INT; }
    bool Value::isFloat() const { return type() == VType::FLOAT; }
    bool Value::isNumber() const { return type() == VType::INT || type() == VType::FLOAT; }
    bool Value::isString() const { return type() == VType::STRING; }
    bool Value::isArray() const { return type() == VType::ARRAY; }
    bool Value::isMap() const { return type() == VType::MAP; }

    // ========================================================================
    // Payload access (unchecked)
    // ========================================================================

    bool Value::asBool() const
    {
        return *static_cast<bool *>(data_->payload);
    }

    int64_t Value::asInt() const
    {
        return *static_cast<int64_t *>(data_->payload);
    }

    double Value::asFloat() const
    {
        return *static_cast<double *>(data_->payload);
    }

    double Value::asNumber() const
    {
        if (type() == VType::INT)
            return static_cast<double>(asInt());
        return asFloat();
    }

    const std::string &Value::asString() const
    {
        return *static_cast<std::string *>(data_->payload);
    }

    const ValueArray &Value::asArray() const
    {
        return *static_cast<ValueArray *>(data_->payload);
    }

    const ValueMap &Value::asMap() const
    {
        return *static_cast<ValueMap *>(data_->payload);
    }

    // ========================================================================
    // toString
    // ========================================================================

    static std::string formatFloat(double val)
    {
        // Integral floats print without a decimal point
        if (val == std::floor(val) && std::isfinite(val) && std::fabs(val) < 1e15)
            return std::to_string(static_cast<long long>(val));
        std::ostringstream oss;
        oss << val;
        return oss.str();
    }

    std::string Value::toString() const
    {
        switch (type())
        {
        case VType::NIL:
            return "<no value>";

        case VType::BOOL:
            return asBool() ? "true" : "false";

        case VType::INT:
            return std::to_string(asInt());

        case VType::FLOAT:
            return formatFloat(asFloat());

        case VType::STRING:
            return asString();

        case VType::ARRAY:
        {
            std::string out = "[";
            const auto &arr = asArray();
            for (size_t i = 0; i < arr.size(); i++)
            {
                if (i > 0)
                    out += ' ';
                out += arr[i].toString();
            }
            out += ']';
            return out;
        }

        case VType::MAP:
        {
            std::string out = "map[";
            bool first = true;
            for (const auto &kv : asMap())
            {
                if (!first)
                    out += ' ';
                first = false;
                out += kv.first;
                out += ':';
                out += kv.second.toString();
            }
            out += ']';
            return out;
        }
        }

        return "unknown";
    }

    // ========================================================================
    // Equality
    // ========================================================================

    bool Value::equals(const Value &other) const
    {
        if (data_ == other.data_)
            return true;

        // INT == FLOAT compares numerically
        if (isNumber() && other.isNumber())
        {
            if (isInt() && other.isInt())
                return asInt() == other.asInt();
            return asNumber() == other.asNumber();
        }

        if (type() != other.type())
            return false;

        switch (type())
        {
        case VType::NIL:
            return true;
        case VType::BOOL:
            return asBool() == other.asBool();
        case VType::INT:
        case VType::FLOAT:
            return false; // handled above
        case VType::STRING:
            return asString() == other.asString();
        case VType::ARRAY:
        {
            const auto &a = asArray();
            const auto &b = other.asArray();
            if (a.size() != b.size())
                return false;
            for (size_t i = 0; i < a.size(); i++)
            {
                if (!a[i].equals(b[i]))
                    return false;
            }
            return true;
        }
        case VType::MAP:
        {
            const auto &a = asMap();
            const auto &b = other.asMap();
            if (a.size() != b.size())
                return false;
            for (const auto &kv : a)
            {
                auto it = b.find(kv.first);
                if (it == b.end() || !kv.second.equals(it->second))
                    return false;
            }
            return true;
        }
        }
        return false;
    }

    // ========================================================================
    // Debug: ref count
    // ========================================================================

    uint32_t Value::refCount() const
    {
        return data_ ? data_->refCount.load(std::memory_order_relaxed) : 0;
    }

} // namespace quill
