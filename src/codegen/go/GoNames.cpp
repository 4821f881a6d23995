//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Go identifier mangling and string literal quoting.

#include "codegen/go/GoNames.hpp"

#include <array>
#include <cstdint>

namespace shgo::codegen::go
{
namespace
{
constexpr std::array<std::string_view, 25> kKeywords{
    "break",  "case",   "chan",  "const",  "continue", "default", "defer",
    "else",   "fallthrough", "for", "func", "go",      "goto",    "if",
    "import", "interface", "map", "package", "range",  "return",  "select",
    "struct", "switch", "type",  "var",
};

constexpr std::array<std::string_view, 44> kPredeclared{
    "any",     "bool",    "byte",    "comparable", "complex64", "complex128", "error",
    "float32", "float64", "int",     "int8",       "int16",     "int32",      "int64",
    "rune",    "string",  "uint",    "uint8",      "uint16",    "uint32",     "uint64",
    "uintptr", "true",    "false",   "iota",       "nil",       "append",     "cap",
    "clear",   "close",   "complex", "copy",       "delete",    "imag",       "len",
    "make",    "max",     "min",     "new",        "panic",     "print",      "println",
    "real",    "recover",
};

/// Package names the generated file may import, plus generator names.
constexpr std::array<std::string_view, 13> kReserved{
    "errors", "exec", "filepath", "fmt",  "io",   "os",   "strconv",
    "strings", "sync", "args",    "err",  "main", "init",
};

bool isIdentStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

template <std::size_t N>
bool contains(const std::array<std::string_view, N> &table, std::string_view name)
{
    for (auto entry : table)
    {
        if (entry == name)
            return true;
    }
    return false;
}

bool hasReservedPrefix(std::string_view name)
{
    if (name.substr(0, 3) == "fn_" || name.substr(0, 2) == "v_")
        return true;
    if (name.size() > 2 && name.substr(0, 2) == "sh")
    {
        const char c = name[2];
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }
    return name == "sh";
}

/// Length of the valid UTF-8 sequence starting at @p i, or 0.
std::size_t utf8Length(std::string_view text, std::size_t i)
{
    const auto lead = static_cast<uint8_t>(text[i]);
    std::size_t len = 0;
    uint32_t min = 0;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        len = 2;
        min = 0x80;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        len = 3;
        min = 0x800;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        len = 4;
        min = 0x10000;
    }
    else
    {
        return 0;
    }
    if (i + len > text.size())
        return 0;

    uint32_t cp = lead & (0x7F >> len);
    for (std::size_t k = 1; k < len; ++k)
    {
        const auto cont = static_cast<uint8_t>(text[i + k]);
        if ((cont & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

void appendHex(std::string &out, uint8_t byte)
{
    static constexpr char kHex[] = "0123456789abcdef";
    out += kHex[byte >> 4];
    out += kHex[byte & 0xF];
}
} // namespace

std::string goQuote(std::string_view text)
{
    std::string out = "\"";
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        switch (c)
        {
            case '"':
                out += "\\\"";
                continue;
            case '\\':
                out += "\\\\";
                continue;
            case '\n':
                out += "\\n";
                continue;
            case '\t':
                out += "\\t";
                continue;
            case '\r':
                out += "\\r";
                continue;
            default:
                break;
        }

        const auto byte = static_cast<uint8_t>(c);
        if (byte < 0x20 || byte == 0x7F)
        {
            out += "\\x";
            appendHex(out, byte);
        }
        else if (byte < 0x80)
        {
            out += c;
        }
        else if (const std::size_t len = utf8Length(text, i); len != 0)
        {
            out.append(text.substr(i, len));
            i += len - 1;
        }
        else
        {
            out += "\\x";
            appendHex(out, byte);
        }
    }
    out += '"';
    return out;
}

bool isGoKeyword(std::string_view name)
{
    return contains(kKeywords, name);
}

bool isGoPredeclared(std::string_view name)
{
    return contains(kPredeclared, name);
}

std::string variableName(std::string_view name)
{
    if (isGoKeyword(name) || isGoPredeclared(name) || contains(kReserved, name) ||
        hasReservedPrefix(name) || name == "_")
    {
        return "v_" + std::string(name);
    }
    return std::string(name);
}

std::string functionName(std::string_view name)
{
    std::string out = "fn_";
    for (const char c : name)
    {
        if (isIdentChar(c))
        {
            out += c;
            continue;
        }
        out += "_x";
        appendHex(out, static_cast<uint8_t>(c));
        out += '_';
    }
    return out;
}

} // namespace shgo::codegen::go
