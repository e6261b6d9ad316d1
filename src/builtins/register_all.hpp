#pragma once

// =============================================================================
// register_all.hpp — wire every builtin category into the registry
// =============================================================================
//
// Called exactly once, from builtinTable().
//
// To add a new category:
//   1. #include "builtins_<category>.hpp"
//   2. Call register<Category>Builtins(t) below.
//
// =============================================================================

#include "builtin_registry.hpp"
#include "builtins_string.hpp"
#include "builtins_json.hpp"

namespace wfexpr
{

    /// Registers every built-in function into the given table.
    inline void registerAllBuiltins(BuiltinTable &t)
    {
        registerStringBuiltins(t);
        registerJsonBuiltins(t);
    }

} // namespace wfexpr
