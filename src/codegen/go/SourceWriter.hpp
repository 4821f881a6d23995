//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/SourceWriter.hpp
// Purpose: Line-oriented text buffer with gofmt-style tab indentation.
// Key invariants: Every emitted line ends with '\n'; indentation is one tab
//                 per level; blank lines carry no trailing whitespace.
// Ownership/Lifetime: Owns its buffer; callers copy or move str() out.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace shgo::codegen::go
{

class SourceWriter
{
  public:
    SourceWriter() = default;

    /// @brief Start a writer whose first level is @p depth.
    explicit SourceWriter(int depth) : depth_(depth) {}

    /// @brief Write @p text at the current indentation.  Text that spans
    ///        several lines must already carry its own inner indentation.
    void line(std::string_view text);

    /// @brief Write an empty line.
    void blank();

    /// @brief Append pre-formatted text verbatim.
    void append(std::string_view text)
    {
        buffer_.append(text);
    }

    /// @brief Write `text {` and indent.
    void open(std::string_view text);

    /// @brief Dedent and write `}` followed by @p suffix.
    void close(std::string_view suffix = {});

    void indent()
    {
        ++depth_;
    }

    void dedent()
    {
        --depth_;
    }

    [[nodiscard]] int depth() const
    {
        return depth_;
    }

    /// @brief Indentation prefix for @p depth levels.
    static std::string tabs(int depth);

    [[nodiscard]] const std::string &str() const
    {
        return buffer_;
    }

  private:
    std::string buffer_;
    int depth_ = 0;
};

} // namespace shgo::codegen::go
