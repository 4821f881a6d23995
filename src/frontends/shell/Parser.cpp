//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the parser entry point, token handling and the list/pipeline
// layers of the grammar.  Command-level productions live in Parser_Cmd.cpp
// and compound commands in Parser_Compound.cpp.
//
//===----------------------------------------------------------------------===//

#include "frontends/shell/Parser.hpp"

#include "support/trace.hpp"

#include <cctype>

namespace shgo::frontends::shell
{

support::Expected<SyntaxTree> parse(std::string_view text, uint32_t fileId)
{
    try
    {
        Lexer lexer(text, fileId);
        Parser parser(lexer);
        SyntaxTree tree = parser.parseFile(fileId);
        support::trace("parse", std::to_string(tree.stmts.size()) + " top-level statements");
        return tree;
    }
    catch (const SyntaxError &err)
    {
        return support::makeError(support::ErrorKind::MalformedSource, err.loc(), err.what());
    }
}

bool isValidName(std::string_view name)
{
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
        return false;
    for (const char c : name)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
            return false;
    }
    return true;
}

bool splitAssignment(Word &word, Assign &out)
{
    if (word.parts.empty() || word.parts.front()->kind != WordPartKind::Lit)
        return false;
    auto &head = static_cast<LitPart &>(*word.parts.front());
    if (head.escaped)
        return false;

    const auto eq = head.value.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;

    std::string name = head.value.substr(0, eq);
    bool append = false;
    if (name.back() == '+')
    {
        append = true;
        name.pop_back();
    }
    if (!isValidName(name))
        return false;

    out.name = std::move(name);
    out.append = append;
    out.hasValue = true;
    out.loc = word.loc;
    out.value.loc = head.loc;
    out.value.parts.clear();

    std::string rest = head.value.substr(eq + 1);
    if (!rest.empty())
        out.value.parts.push_back(std::make_unique<LitPart>(head.loc, std::move(rest)));
    for (std::size_t i = 1; i < word.parts.size(); ++i)
        out.value.parts.push_back(std::move(word.parts[i]));
    word.parts.clear();
    return true;
}

Parser::Parser(Lexer &lexer) : lexer_(lexer)
{
    advance();
}

void Parser::advance()
{
    tok_ = lexer_.next();
}

bool Parser::check(TokenKind kind) const
{
    return tok_.kind == kind;
}

bool Parser::atKeyword(std::string_view word) const
{
    return tok_.kind == TokenKind::Word && tok_.word.isPlainLiteral() && tok_.word.literal() == word;
}

bool Parser::atAnyKeyword(std::initializer_list<std::string_view> words) const
{
    for (auto word : words)
    {
        if (atKeyword(word))
            return true;
    }
    return false;
}

void Parser::skipNewlines()
{
    while (check(TokenKind::Newline))
        advance();
}

void Parser::fail(const std::string &message) const
{
    throw SyntaxError(tok_.loc, message);
}

void Parser::unexpected(std::string_view context) const
{
    std::string found = tok_.kind == TokenKind::Word ? "'" + tok_.word.text() + "'"
                                                     : std::string(tokenKindSpelling(tok_.kind));
    fail("unexpected " + found + " in " + std::string(context));
}

void Parser::expectKeyword(std::string_view word, std::string_view context)
{
    if (!atKeyword(word))
        unexpected(std::string(context) + " (expected '" + std::string(word) + "')");
    advance();
}

void Parser::expect(TokenKind kind, std::string_view context)
{
    if (!check(kind))
        unexpected(std::string(context) + " (expected " + tokenKindSpelling(kind) + ")");
    advance();
}

SyntaxTree Parser::parseFile(uint32_t fileId)
{
    SyntaxTree tree;
    tree.fileId = fileId;
    tree.stmts = parseStmtList({});
    if (!check(TokenKind::EndOfFile))
        unexpected("script");
    return tree;
}

StmtList Parser::parseStmtList(std::initializer_list<std::string_view> stops)
{
    StmtList list;
    while (true)
    {
        skipNewlines();
        if (check(TokenKind::EndOfFile) || check(TokenKind::RParen) || check(TokenKind::DSemi) ||
            check(TokenKind::SemiAmp) || check(TokenKind::DSemiAmp) || atAnyKeyword(stops))
        {
            break;
        }

        StmtPtr stmt = parseAndOr();
        bool more = true;
        if (check(TokenKind::Amp))
        {
            stmt->background = true;
            advance();
        }
        else if (check(TokenKind::Semi))
        {
            advance();
        }
        else if (!check(TokenKind::Newline))
        {
            more = false;
        }
        list.push_back(std::move(stmt));
        if (!more)
            break;
    }
    return list;
}

StmtPtr Parser::parseAndOr()
{
    StmtPtr left = parsePipeline();
    while (check(TokenKind::AndAnd) || check(TokenKind::OrOr))
    {
        const BinaryOp op = check(TokenKind::AndAnd) ? BinaryOp::AndStmt : BinaryOp::OrStmt;
        advance();
        skipNewlines();
        StmtPtr right = parsePipeline();

        auto stmt = std::make_unique<Stmt>();
        stmt->loc = left->loc;
        stmt->cmd = std::make_unique<BinaryCmd>(left->loc, op, std::move(left), std::move(right));
        left = std::move(stmt);
    }
    return left;
}

StmtPtr Parser::parsePipeline()
{
    bool negated = false;
    if (atKeyword("!"))
    {
        negated = true;
        advance();
    }

    StmtPtr left = parseCommand();
    while (check(TokenKind::Pipe) || check(TokenKind::PipeAmp))
    {
        const BinaryOp op = check(TokenKind::Pipe) ? BinaryOp::Pipe : BinaryOp::PipeAll;
        advance();
        skipNewlines();
        StmtPtr right = parseCommand();

        auto stmt = std::make_unique<Stmt>();
        stmt->loc = left->loc;
        stmt->cmd = std::make_unique<BinaryCmd>(left->loc, op, std::move(left), std::move(right));
        left = std::move(stmt);
    }

    if (negated)
        left->negated = true;
    return left;
}

} // namespace shgo::frontends::shell
