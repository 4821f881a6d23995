//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Conversion pipeline: parse, lower, generate, then write or build.

#include "driver/Transpiler.hpp"

#include "codegen/go/GoGenerator.hpp"
#include "driver/BuildDriver.hpp"
#include "frontends/shell/Parser.hpp"
#include "ir/IRBuilder.hpp"
#include "ir/IRPrinter.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <unistd.h>

namespace shgo::driver
{
namespace fs = std::filesystem;

namespace
{
support::Diag ioError(std::string msg)
{
    return support::makeError(support::ErrorKind::IoFailure, {}, std::move(msg));
}
} // namespace

support::Expected<ir::Program> lowerSource(std::string_view text, uint32_t fileId)
{
    auto tree = frontends::shell::parse(text, fileId);
    if (!tree)
        return tree.error();
    return ir::build(tree.value());
}

support::Expected<std::string> transpileSource(std::string_view text, uint32_t fileId)
{
    auto program = lowerSource(text, fileId);
    if (!program)
        return program.error();
    return codegen::go::generate(program.value());
}

support::Expected<std::string> readScript(const std::string &path,
                                          support::SourceManager &sm,
                                          uint32_t &fileId)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("cannot open '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return ioError("cannot read '" + path + "'");
    fileId = sm.addFile(path);
    return ss.str();
}

support::Expected<void> writeFileAtomically(const std::string &path, const std::string &contents)
{
    const fs::path target(path);
    fs::path temp = target;
    temp += ".tmp-" + std::to_string(::getpid());

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out)
            return ioError("cannot write '" + temp.string() + "'");
        out << contents;
        out.close();
        if (!out)
        {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return ioError("cannot write '" + temp.string() + "'");
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return ioError("cannot replace '" + path + "': " + ec.message());
    }
    return {};
}

support::Expected<void> convertFile(const std::string &script,
                                    const std::string &output,
                                    support::SourceManager &sm)
{
    uint32_t fileId = 0;
    auto text = readScript(script, sm, fileId);
    if (!text)
        return text.error();
    auto source = transpileSource(text.value(), fileId);
    if (!source)
        return source.error();
    return writeFileAtomically(output, source.value());
}

support::Expected<void> buildFile(const std::string &script,
                                  const std::string &output,
                                  const support::Options &opts,
                                  support::SourceManager &sm,
                                  ProcessRunner runner)
{
    uint32_t fileId = 0;
    auto text = readScript(script, sm, fileId);
    if (!text)
        return text.error();
    auto source = transpileSource(text.value(), fileId);
    if (!source)
        return source.error();
    BuildDriver driver(opts, std::move(runner));
    return driver.stageAndBuild(source.value(), output);
}

support::Expected<std::string> dumpProgram(const std::string &script, support::SourceManager &sm)
{
    uint32_t fileId = 0;
    auto text = readScript(script, sm, fileId);
    if (!text)
        return text.error();
    auto program = lowerSource(text.value(), fileId);
    if (!program)
        return program.error();
    ir::IRPrinter printer;
    return printer.dump(program.value());
}

} // namespace shgo::driver
