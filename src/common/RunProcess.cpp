//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used to launch the Go toolchain.  The routine builds a
// shell command line from argv fragments, prefixes it with a `cd` into the
// requested working directory, runs it through `popen`, and collects the
// merged output so the build driver can surface tool diagnostics verbatim.
// The calling process never changes its own directory or environment, so
// concurrent launches do not observe each other.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher for the build driver.

#include "common/RunProcess.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>

#include <sys/stat.h>
#include <sys/wait.h>

namespace shgo
{
namespace
{
/// Checks that @p dir names an enterable directory; fills @p reason otherwise.
bool directoryUsable(const std::string &dir, std::string &reason)
{
    struct stat info{};
    if (::stat(dir.c_str(), &info) != 0)
    {
        reason = std::strerror(errno);
        return false;
    }
    if (!S_ISDIR(info.st_mode))
    {
        reason = std::strerror(ENOTDIR);
        return false;
    }
    return true;
}

/// True when @p name can appear on the left of a shell assignment prefix.
bool isAssignableName(const std::string &name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
        return false;
    return std::all_of(name.begin(), name.end(), [](char ch) {
        return ch == '_' || std::isalnum(static_cast<unsigned char>(ch));
    });
}

int normaliseStatus(int status)
{
    if (status == -1)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return status;
}
} // namespace

std::string quote_posix_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');

    for (const char ch : arg)
    {
        if (ch == '\'')
        {
            quoted += "'\\''";
            continue;
        }
        quoted.push_back(ch);
    }

    quoted.push_back('\'');
    return quoted;
}

/// @brief Launch a subprocess using the host shell and capture its output.
/// @details Joins the provided @p argv fragments into a quoted command string,
///          enters @p cwd and applies @p env inside the child shell only, and
///          streams the merged stdout/stderr into RunResult::out.
RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd,
                      const std::vector<std::pair<std::string, std::string>> &env)
{
    RunResult rr{0, "", ""};
    if (argv.empty())
    {
        rr.exit_code = -1;
        rr.err = "empty command line";
        return rr;
    }

    std::string cmd = "{ ";
    if (cwd.has_value())
    {
        std::string reason;
        if (!directoryUsable(*cwd, reason))
        {
            rr.exit_code = -1;
            rr.err = "unable to enter directory '" + *cwd + "': " + reason;
            return rr;
        }
        cmd += "cd " + quote_posix_argument(*cwd) + " && ";
    }

    // Overrides ride on the command line so the parent environment is untouched.
    for (const auto &pair : env)
    {
        if (!isAssignableName(pair.first))
        {
            rr.exit_code = -1;
            rr.err = "invalid environment variable name '" + pair.first + "'";
            return rr;
        }
        cmd += pair.first + "=" + quote_posix_argument(pair.second) + " ";
    }

    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
        {
            cmd += ' ';
        }
        cmd += quote_posix_argument(argv[i]);
    }
    cmd += "; } 2>&1";

    FILE *pipe = ::popen(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.err = std::string("failed to launch '") + argv.front() + "': " + std::strerror(errno);
        return rr;
    }

    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
    {
        rr.out.append(buffer, n);
    }

    rr.exit_code = normaliseStatus(::pclose(pipe));
    return rr;
}

ProcessRunner defaultProcessRunner()
{
    return [](const std::vector<std::string> &argv, const std::optional<std::string> &cwd) {
        return run_process(argv, cwd);
    };
}

} // namespace shgo
