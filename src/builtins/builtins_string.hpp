#pragma once

// =============================================================================
// String builtins — contains, startswith, endswith, join, format
// =============================================================================
// String comparisons in workflow expressions ignore case. Shape mismatches
// in contains / startswith / endswith yield false rather than an error.
// =============================================================================

#include "builtin_registry.hpp"
#include <cctype>
#include <string>

namespace wfexpr
{

    inline void registerStringBuiltins(BuiltinTable &t)
    {
        // contains(search, item) → bool
        //   string search: case-insensitive substring test
        //   array search:  element equal to item (loose equality)
        t["contains"] = {"contains", 2, [](const std::vector<EvaluationResult> &args, int) -> EvaluationResult
                         {
                             const auto &search = args[0];
                             const auto &item = args[1];

                             if (search.primitive())
                             {
                                 if (!item.primitive())
                                     return EvaluationResult::ofBool(false);
                                 std::string haystack = toLowerAscii(search.coerceString());
                                 std::string needle = toLowerAscii(item.coerceString());
                                 return EvaluationResult::ofBool(haystack.find(needle) != std::string::npos);
                             }

                             switch (search.type)
                             {
                             case ValueType::ARRAY:
                             {
                                 // Only primitives can be looked up in an array
                                 if (!item.primitive())
                                     return EvaluationResult::ofBool(false);
                                 const ValueArray *elems = search.coerceSlice();
                                 if (!elems)
                                     return EvaluationResult::ofBool(false);
                                 for (const auto &elem : *elems)
                                 {
                                     if (item.equals(EvaluationResult(elem)))
                                         return EvaluationResult::ofBool(true);
                                 }
                                 return EvaluationResult::ofBool(false);
                             }
                             case ValueType::OBJECT:
                             default:
                                 return EvaluationResult::ofBool(false);
                             }
                         }};

        // startswith(a, b) → bool
        t["startswith"] = {"startswith", 2, [](const std::vector<EvaluationResult> &args, int) -> EvaluationResult
                           {
                               if (!args[0].primitive() || !args[1].primitive())
                                   return EvaluationResult::ofBool(false);
                               std::string s = toLowerAscii(args[0].coerceString());
                               std::string prefix = toLowerAscii(args[1].coerceString());
                               if (prefix.size() > s.size())
                                   return EvaluationResult::ofBool(false);
                               return EvaluationResult::ofBool(s.compare(0, prefix.size(), prefix) == 0);
                           }};

        // endswith(a, b) → bool
        t["endswith"] = {"endswith", 2, [](const std::vector<EvaluationResult> &args, int) -> EvaluationResult
                         {
                             if (!args[0].primitive() || !args[1].primitive())
                                 return EvaluationResult::ofBool(false);
                             std::string s = toLowerAscii(args[0].coerceString());
                             std::string suffix = toLowerAscii(args[1].coerceString());
                             if (suffix.size() > s.size())
                                 return EvaluationResult::ofBool(false);
                             return EvaluationResult::ofBool(s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
                         }};

        // join(array, sep = ",") → string
        //   a primitive first argument comes back untouched
        t["join"] = {"join", -1, [](const std::vector<EvaluationResult> &args, int line) -> EvaluationResult
                     {
                         if (args[0].primitive())
                             return args[0];

                         const ValueArray *elems = args[0].coerceSlice();
                         if (!elems)
                             throw EvaluationError(std::string("join() expects an array or a primitive as first argument, got ") +
                                                       valuetype_name(args[0].type),
                                                   line);

                         std::string sep = args.size() > 1 ? args[1].coerceString() : ",";
                         std::string result;
                         for (size_t i = 0; i < elems->size(); ++i)
                         {
                             if (i > 0)
                                 result += sep;
                             result += EvaluationResult((*elems)[i]).coerceString();
                         }
                         return EvaluationResult::ofString(std::move(result));
                     },
                     2};

        // format(fmt, args...) → string
        //   {N} → coerceString(args[N + 1]),  {{ → {,  }} → }
        t["format"] = {"format", -1, [](const std::vector<EvaluationResult> &args, int line) -> EvaluationResult
                       {
                           const std::string fmt = args[0].coerceString();
                           const size_t supplied = args.size() - 1;
                           std::string out;
                           out.reserve(fmt.size());

                           size_t i = 0;
                           while (i < fmt.size())
                           {
                               char c = fmt[i];
                               if (c == '{')
                               {
                                   if (i + 1 < fmt.size() && fmt[i + 1] == '{')
                                   {
                                       out += '{';
                                       i += 2;
                                       continue;
                                   }
                                   size_t close = fmt.find('}', i + 1);
                                   if (close == std::string::npos)
                                       throw EvaluationError("format() string has an unclosed '{': " + fmt, line);
                                   std::string digits = fmt.substr(i + 1, close - i - 1);
                                   if (digits.empty() || digits.size() > 9)
                                       throw EvaluationError("format() placeholder '{" + digits + "}' is not an index: " + fmt, line);
                                   for (char d : digits)
                                   {
                                       if (!std::isdigit(static_cast<unsigned char>(d)))
                                           throw EvaluationError("format() placeholder '{" + digits + "}' is not an index: " + fmt, line);
                                   }
                                   size_t index = std::stoul(digits);
                                   if (index >= supplied)
                                       throw EvaluationError("format() placeholder {" + digits + "} has no argument (" +
                                                                 std::to_string(supplied) + " supplied): " + fmt,
                                                             line);
                                   out += args[index + 1].coerceString();
                                   i = close + 1;
                                   continue;
                               }
                               if (c == '}')
                               {
                                   if (i + 1 < fmt.size() && fmt[i + 1] == '}')
                                   {
                                       out += '}';
                                       i += 2;
                                       continue;
                                   }
                                   throw EvaluationError("format() string has an unmatched '}': " + fmt, line);
                               }
                               out += c;
                               ++i;
                           }
                           return EvaluationResult::ofString(std::move(out));
                       }};
    }

} // namespace wfexpr
