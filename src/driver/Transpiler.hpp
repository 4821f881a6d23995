//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: driver/Transpiler.hpp
// Purpose: End-to-end conversion entry points: shell text to Program, to Go
//          source, to a written source file, and to a built binary.
// Key invariants: No output file is created or replaced unless conversion
//                 succeeds; convertFile() renames a complete temporary file
//                 into place.
// Ownership/Lifetime: Callers own the SourceManager, which must outlive any
//                     diagnostic returned here.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/RunProcess.hpp"
#include "ir/Program.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace shgo::driver
{

/// @brief Parse and lower @p text into a Program.
support::Expected<ir::Program> lowerSource(std::string_view text, uint32_t fileId);

/// @brief Parse, lower and generate Go source for @p text.
support::Expected<std::string> transpileSource(std::string_view text, uint32_t fileId);

/// @brief Read a script from disk, registering it with @p sm.
/// @param fileId Receives the id assigned by @p sm.
support::Expected<std::string> readScript(const std::string &path,
                                          support::SourceManager &sm,
                                          uint32_t &fileId);

/// @brief Write @p contents to @p path through a temporary sibling file.
support::Expected<void> writeFileAtomically(const std::string &path, const std::string &contents);

/// @brief Convert @p script into Go source at @p output.
support::Expected<void> convertFile(const std::string &script,
                                    const std::string &output,
                                    support::SourceManager &sm);

/// @brief Convert @p script and build it into the executable @p output.
support::Expected<void> buildFile(const std::string &script,
                                  const std::string &output,
                                  const support::Options &opts,
                                  support::SourceManager &sm,
                                  ProcessRunner runner = defaultProcessRunner());

/// @brief Text dump of the Program lowered from @p script.
support::Expected<std::string> dumpProgram(const std::string &script, support::SourceManager &sm);

} // namespace shgo::driver
