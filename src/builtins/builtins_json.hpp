#pragma once

// =============================================================================
// JSON builtins — fromjson, tojson
// =============================================================================

#include "builtin_registry.hpp"
#include "../json/json_codec.hpp"

namespace wfexpr
{

    inline void registerJsonBuiltins(BuiltinTable &t)
    {
        // fromjson(text) → value of whatever shape the document has.
        // Malformed input is an error, never a silent null.
        t["fromjson"] = {"fromjson", 1, [](const std::vector<EvaluationResult> &args, int line) -> EvaluationResult
                         {
                             return EvaluationResult(decodeJson(args[0].coerceString(), line));
                         }};

        // tojson(value) → pretty-printed JSON string
        t["tojson"] = {"tojson", 1, [](const std::vector<EvaluationResult> &args, int) -> EvaluationResult
                       {
                           return EvaluationResult::ofString(encodeJson(args[0].value));
                       }};
    }

} // namespace wfexpr
