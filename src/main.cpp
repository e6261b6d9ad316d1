// =============================================================================
// wfexpr — main entry point
// =============================================================================
//
// Usage:
//   wfexpr <function> [arg ...]          Call a built-in, print the result
//   wfexpr --json <function> [arg ...]   Print the result as JSON
//   wfexpr --list                        List the built-in functions
//   wfexpr --verbose ...                 Echo decoded arguments to stderr
//   wfexpr --version                     Print version information
//   wfexpr --help                        Print usage help
//
// Each argument is read as a JSON literal; anything that isn't valid JSON is
// passed through as a plain string:
//
//   wfexpr contains '["push","pull_request"]' '"push"'    → true
//   wfexpr startswith HelloWorld hello                   → true
//
// WFEXPR_VERBOSE=1 in the environment is the same as --verbose.
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "builtins/builtin_registry.hpp"
#include "json/json_codec.hpp"
#include "lib/errors/error.hpp"

// ---- Helpers ----------------------------------------------------------------

static void printVersion()
{
    std::cout << "wfexpr v0.1.0\n";
    std::cout << "Built-in functions for workflow expressions.\n";
}

static void printHelp()
{
    std::cout << "Usage:\n";
    std::cout << "  wfexpr <function> [arg ...]          Call a built-in, print the result\n";
    std::cout << "  wfexpr --json <function> [arg ...]   Print the result as JSON\n";
    std::cout << "  wfexpr --list                        List the built-in functions\n";
    std::cout << "  wfexpr --verbose ...                 Echo decoded arguments to stderr\n";
    std::cout << "  wfexpr --version                     Show version\n";
    std::cout << "  wfexpr --help                        Show this help\n";
    std::cout << "\nArguments are JSON literals; anything else is taken as a string.\n";
}

static bool envFlag(const char *name)
{
    const char *v = std::getenv(name);
    return v && *v && std::strcmp(v, "0") != 0;
}

// A bare word on the command line is a string, not a JSON error
static wfexpr::EvaluationResult decodeArgument(const std::string &text)
{
    try
    {
        return wfexpr::EvaluationResult(wfexpr::decodeJson(text));
    }
    catch (const wfexpr::ParseError &)
    {
        return wfexpr::EvaluationResult(wfexpr::Value::makeString(text));
    }
}

// ---- Call a function --------------------------------------------------------

static int callBuiltin(const std::string &name, const std::vector<std::string> &rawArgs,
                       bool asJson, bool verbose)
{
    try
    {
        std::vector<wfexpr::EvaluationResult> args;
        args.reserve(rawArgs.size());
        for (const auto &raw : rawArgs)
            args.push_back(decodeArgument(raw));

        if (verbose)
        {
            for (size_t i = 0; i < args.size(); i++)
                std::cerr << "arg " << i << ": " << wfexpr::valuetype_name(args[i].type)
                          << " " << wfexpr::encodeJson(args[i].value, -1) << "\n";
        }

        wfexpr::EvaluationResult result = wfexpr::callFunction(name, args, 1);

        if (verbose)
            std::cerr << "result: " << wfexpr::valuetype_name(result.type) << "\n";

        if (asJson)
            std::cout << wfexpr::encodeJson(result.value) << "\n";
        else
            std::cout << result.coerceString() << "\n";
        return 0;
    }
    catch (const wfexpr::WfexprError &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 2;
    }
}

// ---- Main -------------------------------------------------------------------

int main(int argc, char *argv[])
{
    bool asJson = false;
    bool verbose = envFlag("WFEXPR_VERBOSE");

    int i = 1;
    for (; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return 0;
        }
        if (arg == "--version" || arg == "-v")
        {
            printVersion();
            return 0;
        }
        if (arg == "--list")
        {
            for (const auto &name : wfexpr::functionNames())
            {
                const auto *fn = wfexpr::lookupFunction(name);
                std::cout << name << " (" << fn->arityText() << " arg(s))\n";
            }
            return 0;
        }
        if (arg == "--json")
        {
            asJson = true;
            continue;
        }
        if (arg == "--verbose")
        {
            verbose = true;
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-')
        {
            std::cerr << "Unknown option: " << arg << "\n";
            printHelp();
            return 1;
        }
        break;
    }

    if (i >= argc)
    {
        printHelp();
        return 1;
    }

    std::string name = argv[i++];
    std::vector<std::string> rawArgs;
    for (; i < argc; i++)
        rawArgs.push_back(argv[i]);

    return callBuiltin(name, rawArgs, asJson, verbose);
}
