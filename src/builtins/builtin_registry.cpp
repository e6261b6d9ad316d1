#include "builtin_registry.hpp"
#include "register_all.hpp"
#include <algorithm>

namespace wfexpr
{

    // ========================================================================
    // FunctionDescriptor
    // ========================================================================

    bool FunctionDescriptor::accepts(size_t argc) const
    {
        if (arity >= 0)
            return argc == static_cast<size_t>(arity);
        if (argc < static_cast<size_t>(-arity))
            return false;
        return maxArgs < 0 || argc <= static_cast<size_t>(maxArgs);
    }

    std::string FunctionDescriptor::arityText() const
    {
        if (arity >= 0)
            return std::to_string(arity);
        if (maxArgs < 0)
            return "at least " + std::to_string(-arity);
        return std::to_string(-arity) + " to " + std::to_string(maxArgs);
    }

    // ========================================================================
    // Registry
    // ========================================================================

    const BuiltinTable &builtinTable()
    {
        // Thread-safe one-time construction; never mutated afterwards
        static const BuiltinTable table = []()
        {
            BuiltinTable t;
            registerAllBuiltins(t);
            return t;
        }();
        return table;
    }

    const FunctionDescriptor *lookupFunction(const std::string &name)
    {
        const auto &table = builtinTable();
        auto it = table.find(toLowerAscii(name));
        if (it == table.end())
            return nullptr;
        return &it->second;
    }

    EvaluationResult callFunction(const std::string &name,
                                  const std::vector<EvaluationResult> &args,
                                  int line)
    {
        const FunctionDescriptor *fn = lookupFunction(name);
        if (!fn)
            throw UndefinedFunctionError(name, line);
        if (!fn->accepts(args.size()))
            throw ArityError(fn->name, fn->arityText(), static_cast<int>(args.size()), line);
        return fn->call(args, line);
    }

    std::vector<std::string> functionNames()
    {
        std::vector<std::string> names;
        for (const auto &entry : builtinTable())
            names.push_back(entry.first);
        std::sort(names.begin(), names.end());
        return names;
    }

} // namespace wfexpr
