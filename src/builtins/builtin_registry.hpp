#pragma once

// =============================================================================
// Builtin Registry — central type definitions for wfexpr built-in functions
// =============================================================================
//
// Every built-in module (string, json) registers its functions into a
// BuiltinTable (unordered_map<string, FunctionDescriptor>). The table is
// built once, on first use, and is read-only afterwards, so any number of
// evaluator threads may dispatch through it concurrently.
//
// To add a new category of builtins:
//   1. Create  src/builtins/builtins_<category>.hpp
//   2. Write a free function:
//          void registerXxxBuiltins(BuiltinTable &t);
//   3. Call it from  register_all.hpp → registerAllBuiltins().
//
// Function bodies may assume the dispatcher has already checked the
// argument count against the descriptor.
//
// =============================================================================

#include "../value/evaluation_result.hpp"
#include "../lib/errors/error.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wfexpr
{

    /// Signature every built-in function must match.
    using BuiltinFn = std::function<EvaluationResult(const std::vector<EvaluationResult> &args, int line)>;

    struct FunctionDescriptor
    {
        std::string name;

        /// Positive N: exactly N arguments. Negative -M: at least M.
        int arity;

        BuiltinFn call;

        /// Upper bound for variadic functions, -1 for none.
        int maxArgs = -1;

        bool accepts(size_t argc) const;

        /// "2", "at least 1", "1 to 2"
        std::string arityText() const;
    };

    /// The process-wide table; module functions insert into it.
    using BuiltinTable = std::unordered_map<std::string, FunctionDescriptor>;

    /// The registry, built on first call.
    const BuiltinTable &builtinTable();

    /// Case-insensitive lookup; nullptr if the function doesn't exist.
    const FunctionDescriptor *lookupFunction(const std::string &name);

    /// Looks up `name`, checks the argument count and invokes the function.
    /// Throws UndefinedFunctionError, ArityError, or whatever the body throws.
    EvaluationResult callFunction(const std::string &name,
                                  const std::vector<EvaluationResult> &args,
                                  int line = 0);

    /// Registered names, sorted.
    std::vector<std::string> functionNames();

} // namespace wfexpr
