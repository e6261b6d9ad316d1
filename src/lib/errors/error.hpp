#pragma once

// =============================================================================
// wfexpr errors
// =============================================================================
// Everything a built-in call can throw derives from WfexprError, so an
// evaluator needs one catch clause. Each error keeps the call's source line.
// =============================================================================

#include <stdexcept>
#include <string>

namespace wfexpr
{

    /// what(): "[WFEXPR ERROR] Line N — Category: detail"
    class WfexprError : public std::runtime_error
    {
    public:
        WfexprError(const std::string &category, const std::string &message, int line)
            : std::runtime_error(formatMessage(category, message, line)),
              line_(line), category_(category), detail_(message) {}

        int line() const noexcept { return line_; }
        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        int line_;
        std::string category_;
        std::string detail_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message, int line)
        {
            return "[WFEXPR ERROR] Line " + std::to_string(line) +
                   " \xe2\x80\x94 " + category + ": " + message;
        }
    };

    // ========================================================================
    // 1. Dispatch errors — detected before a function body runs
    // ========================================================================

    /// Function called that isn't registered.
    class UndefinedFunctionError : public WfexprError
    {
    public:
        UndefinedFunctionError(const std::string &name, int line)
            : WfexprError("UndefinedFunction",
                          "'" + name + "' is not a known function", line) {}
    };

    /// Wrong number of arguments passed to a function.
    /// `expected` is a readable form of the contract ("2", "at least 1",
    /// "1 to 2").
    class ArityError : public WfexprError
    {
    public:
        ArityError(const std::string &fnName, const std::string &expected, int got, int line)
            : WfexprError("ArityError",
                          "'" + fnName + "' expects " + expected +
                              " arg(s), got " + std::to_string(got),
                          line) {}

        ArityError(const std::string &fnName, int expected, int got, int line)
            : ArityError(fnName, std::to_string(expected), got, line) {}
    };

    // ========================================================================
    // 2. Evaluation errors — raised by a function body
    // ========================================================================

    /// A built-in could not produce a value from its arguments.
    class EvaluationError : public WfexprError
    {
    public:
        EvaluationError(const std::string &message, int line)
            : WfexprError("EvaluationError", message, line) {}

    protected:
        EvaluationError(const std::string &category, const std::string &message, int line)
            : WfexprError(category, message, line) {}
    };

    /// Input to fromjson() is not a valid JSON document.
    class ParseError : public EvaluationError
    {
    public:
        ParseError(const std::string &input, const std::string &reason, int line)
            : EvaluationError("ParseError",
                              "unable to unmarshal `" + input + "` fromjson: " + reason,
                              line),
              input_(input) {}

        /// The offending text, verbatim.
        const std::string &input() const noexcept { return input_; }

    private:
        std::string input_;
    };

    /// A decoded JSON node has a shape the value model can't represent.
    class UnsupportedTypeError : public EvaluationError
    {
    public:
        UnsupportedTypeError(const std::string &typeName, int line)
            : EvaluationError("UnsupportedTypeError",
                              "unknown type " + typeName + " in fromjson", line) {}
    };

} // namespace wfexpr
