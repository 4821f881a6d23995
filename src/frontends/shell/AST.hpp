//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/AST.hpp
// Purpose: Umbrella header for the shell syntax tree.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/AST_Cmd.hpp"
#include "frontends/shell/AST_Word.hpp"
