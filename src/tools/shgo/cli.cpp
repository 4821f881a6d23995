//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Command-line parsing and subcommand dispatch for the shgo driver.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing for the `shgo` CLI.

#include "tools/shgo/cli.hpp"

#include "support/trace.hpp"

#include <string_view>

namespace shgo::tools
{
namespace
{
/// @brief Fetch the value of option @p name, from `--name=value` or the next argument.
bool takeValue(int &i, int argc, char **argv, std::string_view name, std::string &value,
               std::ostream &err)
{
    const std::string_view arg = argv[i];
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=')
    {
        value = std::string(arg.substr(name.size() + 1));
        return true;
    }
    if (i + 1 >= argc)
    {
        err << "error: " << name << " requires a value\n";
        return false;
    }
    value = argv[++i];
    return true;
}

bool matches(std::string_view arg, std::string_view name)
{
    return arg == name || (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
                           arg[name.size()] == '=');
}
} // namespace

CliParseResult parseCommandLine(int argc, char **argv, CliOptions &cli, std::ostream &err)
{
    if (argc < 2)
    {
        err << "error: missing command\n";
        return CliParseResult::Error;
    }

    const std::string_view first = argv[1];
    if (first == "--help" || first == "-h")
        return CliParseResult::Help;
    if (first == "--version")
        return CliParseResult::Version;
    if (first != "convert" && first != "build" && first != "ir")
    {
        err << "error: unknown command '" << first << "'\n";
        return CliParseResult::Error;
    }
    cli.command = std::string(first);

    bool buildOption = false;
    for (int i = 2; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return CliParseResult::Help;
        if (arg == "--trace")
        {
            cli.opts.trace = true;
        }
        else if (arg == "--keep-workspace")
        {
            cli.opts.keepWorkspace = true;
            buildOption = true;
        }
        else if (arg == "-o")
        {
            if (!takeValue(i, argc, argv, "-o", cli.output, err))
                return CliParseResult::Error;
        }
        else if (matches(arg, "--workspace"))
        {
            if (!takeValue(i, argc, argv, "--workspace", cli.opts.workspaceDir, err))
                return CliParseResult::Error;
            buildOption = true;
        }
        else if (matches(arg, "--go"))
        {
            if (!takeValue(i, argc, argv, "--go", cli.opts.goTool, err))
                return CliParseResult::Error;
            buildOption = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            err << "error: unknown option '" << arg << "'\n";
            return CliParseResult::Error;
        }
        else if (cli.script.empty())
        {
            cli.script = std::string(arg);
        }
        else
        {
            err << "error: unexpected argument '" << arg << "'\n";
            return CliParseResult::Error;
        }
    }

    if (cli.script.empty())
    {
        err << "error: " << cli.command << " requires a script\n";
        return CliParseResult::Error;
    }
    if (cli.command == "ir")
    {
        if (!cli.output.empty())
        {
            err << "error: ir writes to standard output and takes no -o\n";
            return CliParseResult::Error;
        }
    }
    else if (cli.output.empty())
    {
        err << "error: " << cli.command << " requires -o <path>\n";
        return CliParseResult::Error;
    }
    if (buildOption && cli.command != "build")
    {
        err << "error: workspace and toolchain options apply only to build\n";
        return CliParseResult::Error;
    }
    return CliParseResult::Run;
}

int runCli(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    CliOptions cli;
    support::applyEnvironment(cli.opts);

    switch (parseCommandLine(argc, argv, cli, err))
    {
        case CliParseResult::Help:
            printUsage(out);
            return 0;
        case CliParseResult::Version:
            printVersion(out);
            return 0;
        case CliParseResult::Error:
            printUsage(err);
            return kUsageError;
        case CliParseResult::Run:
            break;
    }

    if (cli.opts.trace)
        support::setTraceEnabled(true);

    if (cli.command == "convert")
        return cmdConvert(cli, err);
    if (cli.command == "build")
        return cmdBuild(cli, err);
    return cmdIr(cli, out, err);
}

} // namespace shgo::tools
