#pragma once

// =============================================================================
// JSON codec — nlohmann::json ⇄ Value
// =============================================================================
//
// decodeJson   text  → Value   (fromjson, CLI arguments)
// encodeJson   Value → text    (tojson, CLI --json output)
//
// Decoding is strict: malformed text, numbers out of double range and
// documents nested deeper than 10000 levels raise ParseError carrying the
// input and the reason; decoding never degrades to null or empty.
// =============================================================================

#include "../value/value.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wfexpr
{

    /// Classifies a decoded JSON node. Throws UnsupportedTypeError for the
    /// node kinds JSON text can't produce (binary, discarded).
    ValueType getExprType(const nlohmann::json &node, int line = 0);

    /// Converts a decoded node (recursively) into a Value. Containers nested
    /// more than 10000 levels deep raise ParseError.
    Value fromJsonNode(const nlohmann::json &node, int line = 0);

    /// Parses `text` as one JSON document.
    Value decodeJson(const std::string &text, int line = 0);

    nlohmann::json toJsonNode(const Value &value);

    /// `indent` < 0 gives the compact single-line form.
    std::string encodeJson(const Value &value, int indent = 2);

} // namespace wfexpr
