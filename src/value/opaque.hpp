#pragma once

// =============================================================================
// OpaqueValue — the type-erased argument/result handle
// =============================================================================
//
// The template engine captures arguments at parse time without knowing the
// signature of the function they will be passed to. It hands them over as
// shared, immutable, type-erased boxes. In practice every box holds a Value,
// but the binding layer still checks (viewOpaque) before trusting it.
//
// =============================================================================

#include "value.hpp"
#include <any>
#include <memory>
#include <vector>

namespace quill
{

    using OpaqueValue = std::shared_ptr<const std::any>;

    /// Arguments for one call, in declaration order.
    using ArgumentList = std::vector<OpaqueValue>;

    /// Box a Value for the engine.
    inline OpaqueValue wrapOpaque(Value value)
    {
        return std::make_shared<std::any>(std::move(value));
    }

    /// Downcast: the held Value, or nullptr if the handle is empty or holds
    /// some other payload.
    inline const Value *viewOpaque(const OpaqueValue &opaque)
    {
        if (!opaque)
            return nullptr;
        return std::any_cast<Value>(opaque.get());
    }

    /// Short description of what a handle holds, for downcast diagnostics.
    inline std::string describeOpaque(const OpaqueValue &opaque)
    {
        if (!opaque)
            return "null handle";
        if (!opaque->has_value())
            return "empty handle";
        return "foreign payload";
    }

} // namespace quill
