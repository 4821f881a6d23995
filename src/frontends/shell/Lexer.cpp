//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the shell lexer.  Operators are recognised greedily (`;;&`
// before `;;` before `;`), a digit run immediately followed by `<` or `>` is
// a descriptor prefix, and everything else is accumulated into a word until
// an unquoted metacharacter is reached.
//
//===----------------------------------------------------------------------===//

#include "frontends/shell/Lexer.hpp"

#include <cctype>
#include <memory>

namespace shgo::frontends::shell
{
namespace
{
bool isNameStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isSpecialParam(char c)
{
    switch (c)
    {
        case '@':
        case '*':
        case '#':
        case '?':
        case '$':
        case '!':
        case '-':
            return true;
        default:
            return false;
    }
}

/// True when @p lit is `NAME=` or `NAME+=`, i.e. an array literal may follow.
bool endsAssignmentPrefix(const std::string &lit)
{
    if (lit.size() < 2 || lit.back() != '=' || !isNameStart(lit.front()))
        return false;
    std::size_t end = lit.size() - 1;
    if (lit[end - 1] == '+')
        --end;
    for (std::size_t i = 1; i < end; ++i)
    {
        if (!isNameChar(lit[i]))
            return false;
    }
    return true;
}
} // namespace

const char *tokenKindSpelling(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::EndOfFile:
            return "end of file";
        case TokenKind::Newline:
            return "newline";
        case TokenKind::Word:
            return "word";
        case TokenKind::Redirect:
            return "redirection";
        case TokenKind::Semi:
            return "';'";
        case TokenKind::DSemi:
            return "';;'";
        case TokenKind::SemiAmp:
            return "';&'";
        case TokenKind::DSemiAmp:
            return "';;&'";
        case TokenKind::Amp:
            return "'&'";
        case TokenKind::AndAnd:
            return "'&&'";
        case TokenKind::Pipe:
            return "'|'";
        case TokenKind::PipeAmp:
            return "'|&'";
        case TokenKind::OrOr:
            return "'||'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::DLParen:
            return "'(('";
    }
    return "token";
}

Lexer::Lexer(std::string_view src, uint32_t file_id) : src_(src), file_id_(file_id) {}

char Lexer::peek(std::size_t offset) const
{
    const std::size_t idx = pos_ + offset;
    return idx < src_.size() ? src_[idx] : '\0';
}

char Lexer::get()
{
    if (pos_ >= src_.size())
        return '\0';
    const char c = src_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= src_.size();
}

support::SourceLoc Lexer::here() const
{
    return {file_id_, line_, column_};
}

void Lexer::queueHeredoc(std::string delimiter, bool stripTabs)
{
    heredocs_.emplace_back(std::move(delimiter), stripTabs);
}

void Lexer::skipBlanksAndComments()
{
    while (!eof())
    {
        const char c = peek();
        if (c == ' ' || c == '\t' || c == '\r')
        {
            get();
        }
        else if (c == '\\' && peek(1) == '\n')
        {
            get();
            get();
        }
        else if (c == '#')
        {
            while (!eof() && peek() != '\n')
                get();
        }
        else
        {
            break;
        }
    }
}

void Lexer::skipHeredocBodies()
{
    for (const auto &[delimiter, stripTabs] : heredocs_)
    {
        const auto start = here();
        bool closed = false;
        while (!eof())
        {
            std::string line;
            while (!eof() && peek() != '\n')
                line += get();
            get();
            std::size_t first = 0;
            if (stripTabs)
            {
                while (first < line.size() && line[first] == '\t')
                    ++first;
            }
            if (line.compare(first, std::string::npos, delimiter) == 0)
            {
                closed = true;
                break;
            }
        }
        if (!closed)
            throw SyntaxError(start, "unterminated heredoc (wanted '" + delimiter + "')");
    }
    heredocs_.clear();
}

Token Lexer::next()
{
    skipBlanksAndComments();

    Token tok;
    tok.loc = here();
    if (eof())
    {
        tok.kind = TokenKind::EndOfFile;
        return tok;
    }

    const char c = peek();
    switch (c)
    {
        case '\n':
            get();
            skipHeredocBodies();
            tok.kind = TokenKind::Newline;
            return tok;
        case ';':
            get();
            if (peek() == ';')
            {
                get();
                if (peek() == '&')
                {
                    get();
                    tok.kind = TokenKind::DSemiAmp;
                }
                else
                {
                    tok.kind = TokenKind::DSemi;
                }
            }
            else if (peek() == '&')
            {
                get();
                tok.kind = TokenKind::SemiAmp;
            }
            else
            {
                tok.kind = TokenKind::Semi;
            }
            return tok;
        case '&':
            get();
            if (peek() == '&')
            {
                get();
                tok.kind = TokenKind::AndAnd;
            }
            else if (peek() == '>')
            {
                get();
                tok.kind = TokenKind::Redirect;
                tok.redir = RedirOp::AllOut;
                if (peek() == '>')
                {
                    get();
                    tok.redir = RedirOp::AllAppend;
                }
            }
            else
            {
                tok.kind = TokenKind::Amp;
            }
            return tok;
        case '|':
            get();
            if (peek() == '|')
            {
                get();
                tok.kind = TokenKind::OrOr;
            }
            else if (peek() == '&')
            {
                get();
                tok.kind = TokenKind::PipeAmp;
            }
            else
            {
                tok.kind = TokenKind::Pipe;
            }
            return tok;
        case '(':
            get();
            if (peek() == '(')
            {
                get();
                tok.kind = TokenKind::DLParen;
                tok.text = readArithmetic(tok.loc);
            }
            else
            {
                tok.kind = TokenKind::LParen;
            }
            return tok;
        case ')':
            get();
            tok.kind = TokenKind::RParen;
            return tok;
        case '<':
        case '>':
            if (peek(1) != '(')
                return lexRedirect(-1, tok.loc);
            return lexWord();
        default:
            break;
    }

    if (std::isdigit(static_cast<unsigned char>(c)))
    {
        std::size_t end = pos_;
        while (end < src_.size() && std::isdigit(static_cast<unsigned char>(src_[end])))
            ++end;
        if (end < src_.size() && (src_[end] == '<' || src_[end] == '>') &&
            (end + 1 >= src_.size() || src_[end + 1] != '('))
        {
            int fd = 0;
            while (pos_ < end)
                fd = fd * 10 + (get() - '0');
            return lexRedirect(fd, tok.loc);
        }
    }

    return lexWord();
}

Token Lexer::lexRedirect(int fd, support::SourceLoc loc)
{
    Token tok;
    tok.kind = TokenKind::Redirect;
    tok.loc = loc;
    tok.fd = fd;

    if (get() == '<')
    {
        if (peek() == '<')
        {
            get();
            if (peek() == '<')
            {
                get();
                tok.redir = RedirOp::HereString;
            }
            else if (peek() == '-')
            {
                get();
                tok.redir = RedirOp::DashHeredoc;
            }
            else
            {
                tok.redir = RedirOp::Heredoc;
            }
        }
        else if (peek() == '&')
        {
            get();
            tok.redir = RedirOp::DupIn;
        }
        else if (peek() == '>')
        {
            get();
            tok.redir = RedirOp::InOut;
        }
        else
        {
            tok.redir = RedirOp::In;
        }
        return tok;
    }

    if (peek() == '>')
    {
        get();
        tok.redir = RedirOp::Append;
    }
    else if (peek() == '&')
    {
        get();
        tok.redir = RedirOp::DupOut;
    }
    else if (peek() == '|')
    {
        get();
        tok.redir = RedirOp::Clobber;
    }
    else
    {
        tok.redir = RedirOp::Out;
    }
    return tok;
}

Token Lexer::lexWord()
{
    Token tok;
    tok.kind = TokenKind::Word;
    tok.loc = here();
    tok.word.loc = tok.loc;
    auto &parts = tok.word.parts;

    std::string lit;
    support::SourceLoc litLoc;
    auto flush = [&]() {
        if (!lit.empty())
            parts.push_back(std::make_unique<LitPart>(litLoc, std::move(lit)));
        lit.clear();
    };
    auto addChar = [&](char ch) {
        if (lit.empty())
            litLoc = here();
        lit += ch;
    };

    while (!eof())
    {
        const char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';' || c == '&' || c == '|' ||
            c == ')')
        {
            break;
        }

        if (c == '(')
        {
            if (parts.empty() && endsAssignmentPrefix(lit))
            {
                const auto loc = here();
                get();
                flush();
                parts.push_back(
                    std::make_unique<ArrayLitPart>(loc, readBalanced('(', ')', loc, "array literal")));
                continue;
            }
            break;
        }

        if (c == '<' || c == '>')
        {
            if (peek(1) == '(' && parts.empty() && lit.empty())
            {
                const auto loc = here();
                const bool input = get() == '<';
                get();
                parts.push_back(std::make_unique<ProcSubstPart>(
                    loc, input, readBalanced('(', ')', loc, "process substitution")));
                continue;
            }
            break;
        }

        switch (c)
        {
            case '\\':
            {
                const auto loc = here();
                get();
                if (peek() == '\n')
                {
                    get();
                    continue;
                }
                if (eof())
                {
                    addChar('\\');
                    continue;
                }
                flush();
                parts.push_back(std::make_unique<LitPart>(loc, std::string(1, get()), true));
                continue;
            }
            case '\'':
                flush();
                parts.push_back(lexSingleQuoted());
                continue;
            case '"':
                flush();
                parts.push_back(lexDoubleQuoted());
                continue;
            case '`':
                flush();
                parts.push_back(lexBackquote());
                continue;
            case '$':
                if (peek(1) == '\'')
                {
                    flush();
                    parts.push_back(lexAnsiQuoted());
                    continue;
                }
                if (peek(1) == '"')
                {
                    get();
                    flush();
                    parts.push_back(lexDoubleQuoted());
                    continue;
                }
                {
                    const auto loc = here();
                    if (auto part = lexDollar())
                    {
                        flush();
                        parts.push_back(std::move(part));
                    }
                    else
                    {
                        if (lit.empty())
                            litLoc = loc;
                        lit += '$';
                    }
                }
                continue;
            default:
                addChar(get());
                continue;
        }
    }
    flush();

    if (parts.empty())
        return next();
    return tok;
}

WordPartPtr Lexer::lexDollar()
{
    const auto loc = here();
    get(); // '$'
    const char c = peek();

    if (c == '(')
    {
        get();
        if (peek() == '(')
        {
            get();
            return std::make_unique<ArithmExpPart>(loc, readArithmetic(loc));
        }
        return std::make_unique<CmdSubstPart>(loc, readBalanced('(', ')', loc, "command substitution"),
                                              false);
    }
    if (c == '{')
    {
        get();
        return lexParamBraced(loc);
    }
    if (isNameStart(c))
    {
        std::string name;
        while (isNameChar(peek()))
            name += get();
        return std::make_unique<ParamExpPart>(loc, std::move(name));
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || isSpecialParam(c))
        return std::make_unique<ParamExpPart>(loc, std::string(1, get()));

    return nullptr;
}

WordPartPtr Lexer::lexParamBraced(support::SourceLoc loc)
{
    const std::string content = readBalanced('{', '}', loc, "parameter expansion");
    std::size_t i = 0;
    bool length = false;
    if (content.size() > 1 && content[0] == '#')
    {
        length = true;
        i = 1;
    }

    std::string name;
    if (i < content.size() && isNameStart(content[i]))
    {
        while (i < content.size() && isNameChar(content[i]))
            name += content[i++];
    }
    else if (i < content.size() && std::isdigit(static_cast<unsigned char>(content[i])))
    {
        while (i < content.size() && std::isdigit(static_cast<unsigned char>(content[i])))
            name += content[i++];
    }
    else if (i < content.size() && isSpecialParam(content[i]))
    {
        name += content[i++];
    }
    else
    {
        throw SyntaxError(loc, "bad substitution '${" + content + "}'");
    }

    auto part = std::make_unique<ParamExpPart>(loc, std::move(name));
    part->braced = true;
    part->length = length;
    part->modifier = content.substr(i);
    return part;
}

WordPartPtr Lexer::lexSingleQuoted()
{
    const auto loc = here();
    get(); // '\''
    std::string value;
    while (true)
    {
        if (eof())
            throw SyntaxError(loc, "unterminated single-quoted string");
        const char c = get();
        if (c == '\'')
            break;
        value += c;
    }
    return std::make_unique<SglQuotedPart>(loc, std::move(value));
}

WordPartPtr Lexer::lexAnsiQuoted()
{
    const auto loc = here();
    get(); // '$'
    get(); // '\''
    std::string value;
    while (true)
    {
        if (eof())
            throw SyntaxError(loc, "unterminated $'...' string");
        const char c = get();
        if (c == '\'')
            break;
        if (c != '\\' || eof())
        {
            value += c;
            continue;
        }
        const char e = get();
        switch (e)
        {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case 'r':
                value += '\r';
                break;
            case 'a':
                value += '\a';
                break;
            case 'b':
                value += '\b';
                break;
            case 'e':
            case 'E':
                value += '\x1b';
                break;
            case '\\':
            case '\'':
            case '"':
                value += e;
                break;
            default:
                value += '\\';
                value += e;
                break;
        }
    }
    return std::make_unique<SglQuotedPart>(loc, std::move(value));
}

WordPartPtr Lexer::lexDoubleQuoted()
{
    const auto loc = here();
    get(); // '"'
    auto dq = std::make_unique<DblQuotedPart>(loc);

    std::string lit;
    support::SourceLoc litLoc;
    auto flush = [&]() {
        if (!lit.empty())
            dq->parts.push_back(std::make_unique<LitPart>(litLoc, std::move(lit)));
        lit.clear();
    };
    auto addChar = [&](char ch) {
        if (lit.empty())
            litLoc = here();
        lit += ch;
    };

    while (true)
    {
        if (eof())
            throw SyntaxError(loc, "unterminated double-quoted string");
        const char c = peek();
        if (c == '"')
        {
            get();
            break;
        }
        if (c == '\\')
        {
            const char n = peek(1);
            if (n == '$' || n == '`' || n == '"' || n == '\\')
            {
                get();
                addChar(get());
                continue;
            }
            if (n == '\n')
            {
                get();
                get();
                continue;
            }
            addChar(get());
            continue;
        }
        if (c == '$')
        {
            const auto dollarLoc = here();
            if (auto part = lexDollar())
            {
                flush();
                dq->parts.push_back(std::move(part));
            }
            else
            {
                if (lit.empty())
                    litLoc = dollarLoc;
                lit += '$';
            }
            continue;
        }
        if (c == '`')
        {
            flush();
            dq->parts.push_back(lexBackquote());
            continue;
        }
        addChar(get());
    }
    flush();
    return dq;
}

WordPartPtr Lexer::lexBackquote()
{
    const auto loc = here();
    get(); // '`'
    std::string text;
    while (true)
    {
        if (eof())
            throw SyntaxError(loc, "unterminated backquote substitution");
        const char c = get();
        if (c == '`')
            break;
        if (c == '\\' && (peek() == '`' || peek() == '\\' || peek() == '$'))
        {
            text += get();
            continue;
        }
        text += c;
    }
    return std::make_unique<CmdSubstPart>(loc, std::move(text), true);
}

std::string Lexer::readBalanced(char open, char close, support::SourceLoc start, const char *what)
{
    std::string text;
    int depth = 1;
    while (true)
    {
        if (eof())
            throw SyntaxError(start, std::string("unterminated ") + what);
        const char c = get();
        if (c == '\\')
        {
            text += c;
            if (!eof())
                text += get();
            continue;
        }
        if (c == '\'' && open == '(')
        {
            text += c;
            while (!eof() && peek() != '\'')
                text += get();
            if (!eof())
                text += get();
            continue;
        }
        if (c == '"')
        {
            text += c;
            while (!eof() && peek() != '"')
            {
                if (peek() == '\\')
                    text += get();
                if (!eof())
                    text += get();
            }
            if (!eof())
                text += get();
            continue;
        }
        if (c == open)
        {
            ++depth;
        }
        else if (c == close && --depth == 0)
        {
            break;
        }
        text += c;
    }
    return text;
}

std::string Lexer::readArithmetic(support::SourceLoc start)
{
    std::string text;
    int depth = 0;
    while (true)
    {
        if (eof())
            throw SyntaxError(start, "unterminated arithmetic expression");
        const char c = get();
        if (c == '(')
        {
            ++depth;
        }
        else if (c == ')')
        {
            if (depth == 0 && peek() == ')')
            {
                get();
                break;
            }
            if (depth > 0)
                --depth;
        }
        text += c;
    }
    return text;
}

} // namespace shgo::frontends::shell
