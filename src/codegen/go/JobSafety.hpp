//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/JobSafety.hpp
// Purpose: Static check that background jobs, which run as goroutines of one
//          Go process, never observe or cause changes to state a shell keeps
//          per process: the working directory, the standard streams, the
//          environment and shared variables.
//
// Rules enforced by checkJobSafety:
//   - Inside a background unit (including functions it calls): no `cd`, no
//     redirection, no environment change, no `wait`, and no function that
//     assigns a global variable.
//   - In foreground code while a job may still be running (after `&`, until
//     the next `wait`): no `cd`, no redirection, no environment change,
//     directly or through a function, and no assignment to a global that a
//     function called by a running job reads.
//
// Variables a background unit references or assigns directly are copied
// when the job starts (see jobNames), so they need no rule of their own.
//
// Key invariants: The check is conservative; a job "may be running" on
//                 every path that reaches a statement without a `wait`.
// Ownership/Lifetime: Stateless free functions over a borrowed Program.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Program.hpp"

#include <set>
#include <string>

namespace shgo::codegen::go
{

/// @brief Throw ir::LoweringError for the first statement that breaks a job
///        rule; does nothing for programs without background jobs.
void checkJobSafety(const ir::Program &program);

/// @brief Shell names @p unit references or assigns directly, not counting
///        the bodies of functions it calls.
std::set<std::string> jobNames(const ir::Statement &unit);

} // namespace shgo::codegen::go
