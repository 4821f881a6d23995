//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Indenting line writer used by the Go generator.

#include "codegen/go/SourceWriter.hpp"

namespace shgo::codegen::go
{

void SourceWriter::line(std::string_view text)
{
    if (text.empty())
    {
        blank();
        return;
    }
    buffer_ += tabs(depth_);
    buffer_.append(text);
    buffer_ += '\n';
}

void SourceWriter::blank()
{
    buffer_ += '\n';
}

void SourceWriter::open(std::string_view text)
{
    line(std::string(text) + " {");
    ++depth_;
}

void SourceWriter::close(std::string_view suffix)
{
    --depth_;
    line("}" + std::string(suffix));
}

std::string SourceWriter::tabs(int depth)
{
    return std::string(depth > 0 ? static_cast<std::size_t>(depth) : 0, '\t');
}

} // namespace shgo::codegen::go
