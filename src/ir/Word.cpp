//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Helpers for IR words.

#include "ir/Word.hpp"

namespace shgo::ir
{

Word Word::literal(std::string text)
{
    Word word;
    word.segments.push_back({WordSegment::Kind::Literal, std::move(text)});
    return word;
}

bool Word::isLiteral() const
{
    for (const auto &seg : segments)
    {
        if (seg.kind != WordSegment::Kind::Literal)
            return false;
    }
    return true;
}

std::string Word::literalText() const
{
    std::string out;
    for (const auto &seg : segments)
    {
        if (seg.kind == WordSegment::Kind::Literal)
            out += seg.text;
    }
    return out;
}

bool Word::hasCommandSubst() const
{
    for (const auto &seg : segments)
    {
        if (seg.kind == WordSegment::Kind::CommandSubst)
            return true;
    }
    return false;
}

std::string Word::text() const
{
    std::string out;
    for (const auto &seg : segments)
        out += seg.text;
    return out;
}

void Word::append(WordSegment::Kind kind, std::string text)
{
    if (kind != WordSegment::Kind::CommandSubst && !segments.empty() &&
        segments.back().kind == kind)
    {
        segments.back().text += text;
        return;
    }
    segments.push_back({kind, std::move(text)});
}

} // namespace shgo::ir
