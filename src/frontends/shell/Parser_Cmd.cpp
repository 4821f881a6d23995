//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Command-level productions: dispatch on the leading token, simple commands
// with prefix assignments, redirections, function declarations in both
// spellings, and the declaration builtins.
//
//===----------------------------------------------------------------------===//

#include "frontends/shell/Parser.hpp"

namespace shgo::frontends::shell
{
namespace
{
bool isDeclBuiltin(const std::string &name)
{
    return name == "export" || name == "local" || name == "declare" || name == "typeset" ||
           name == "readonly";
}

/// Heredoc delimiters are compared after quote removal.
std::string unquotedText(const Word &word)
{
    std::string out;
    for (const auto &part : word.parts)
    {
        switch (part->kind)
        {
            case WordPartKind::Lit:
                out += static_cast<const LitPart &>(*part).value;
                break;
            case WordPartKind::SglQuoted:
                out += static_cast<const SglQuotedPart &>(*part).value;
                break;
            case WordPartKind::DblQuoted:
                for (const auto &inner : static_cast<const DblQuotedPart &>(*part).parts)
                {
                    if (inner->kind == WordPartKind::Lit)
                        out += static_cast<const LitPart &>(*inner).value;
                }
                break;
            default:
                break;
        }
    }
    return out;
}
} // namespace

StmtPtr Parser::parseCommand()
{
    const auto loc = tok_.loc;
    CommandPtr cmd;

    if (check(TokenKind::Word))
    {
        if (atKeyword("{"))
            cmd = parseBlock();
        else if (atKeyword("if"))
            cmd = parseIf();
        else if (atKeyword("while"))
            cmd = parseWhile(false);
        else if (atKeyword("until"))
            cmd = parseWhile(true);
        else if (atKeyword("for"))
            cmd = parseFor();
        else if (atKeyword("case"))
            cmd = parseCase();
        else if (atKeyword("[["))
            cmd = parseTestClause();
        else if (atKeyword("function"))
            return parseFunctionKeyword();
        else if (atAnyKeyword({"then", "else", "elif", "fi", "do", "done", "esac", "}"}))
            unexpected("command position");
        else
            return parseSimpleCommand();
    }
    else if (check(TokenKind::LParen))
    {
        cmd = parseSubshell();
    }
    else if (check(TokenKind::DLParen))
    {
        cmd = std::make_unique<ArithmCmd>(loc, tok_.text);
        advance();
    }
    else if (check(TokenKind::Redirect))
    {
        return parseSimpleCommand();
    }
    else
    {
        unexpected("command position");
    }

    auto stmt = std::make_unique<Stmt>();
    stmt->loc = loc;
    stmt->cmd = std::move(cmd);
    parseRedirects(*stmt);
    return stmt;
}

StmtPtr Parser::parseSimpleCommand()
{
    auto stmt = std::make_unique<Stmt>();
    stmt->loc = tok_.loc;
    auto call = std::make_unique<CallExpr>(tok_.loc);

    while (true)
    {
        if (check(TokenKind::Redirect))
        {
            stmt->redirs.push_back(parseRedirect());
            continue;
        }
        if (!check(TokenKind::Word))
            break;

        Word word = std::move(tok_.word);
        advance();

        if (call->args.empty())
        {
            Assign assign;
            if (splitAssignment(word, assign))
            {
                call->assigns.push_back(std::move(assign));
                continue;
            }
            if (call->assigns.empty() && stmt->redirs.empty() && check(TokenKind::LParen) &&
                word.isPlainLiteral())
            {
                advance();
                expect(TokenKind::RParen, "function declaration");
                return parseFunctionBody(std::move(stmt), word.literal(), false);
            }
        }
        call->args.push_back(std::move(word));
    }

    if (call->args.empty() && call->assigns.empty() && stmt->redirs.empty())
        unexpected("command");

    if (!call->args.empty() && call->assigns.empty() && isDeclBuiltin(call->args.front().literal()))
    {
        stmt->cmd = makeDeclClause(*call);
        return stmt;
    }

    stmt->cmd = std::move(call);
    return stmt;
}

StmtPtr Parser::parseFunctionBody(StmtPtr head, std::string name, bool keyword)
{
    skipNewlines();
    StmtPtr body = parseCommand();
    switch (body->cmd->kind)
    {
        case CommandKind::Block:
        case CommandKind::Subshell:
        case CommandKind::If:
        case CommandKind::While:
        case CommandKind::For:
        case CommandKind::Case:
        case CommandKind::Arithm:
        case CommandKind::Test:
            break;
        default:
            throw SyntaxError(body->loc, "function '" + name + "' body must be a compound command");
    }

    auto decl = std::make_unique<FuncDecl>(head->loc, std::move(name));
    decl->keyword = keyword;
    decl->body = std::move(body);
    head->cmd = std::move(decl);
    return head;
}

StmtPtr Parser::parseFunctionKeyword()
{
    auto stmt = std::make_unique<Stmt>();
    stmt->loc = tok_.loc;
    advance(); // function

    if (!check(TokenKind::Word) || !tok_.word.isPlainLiteral())
        unexpected("function declaration");
    std::string name = tok_.word.literal();
    advance();

    if (check(TokenKind::LParen))
    {
        advance();
        expect(TokenKind::RParen, "function declaration");
    }
    return parseFunctionBody(std::move(stmt), std::move(name), true);
}

void Parser::parseRedirects(Stmt &stmt)
{
    while (check(TokenKind::Redirect))
        stmt.redirs.push_back(parseRedirect());
}

Redirect Parser::parseRedirect()
{
    Redirect redir;
    redir.op = tok_.redir;
    redir.fd = tok_.fd;
    redir.loc = tok_.loc;
    advance();

    if (!check(TokenKind::Word))
        unexpected(std::string("redirection '") + redirOpSpelling(redir.op) + "'");
    redir.target = std::move(tok_.word);

    if (redir.op == RedirOp::Heredoc || redir.op == RedirOp::DashHeredoc)
        lexer_.queueHeredoc(unquotedText(redir.target), redir.op == RedirOp::DashHeredoc);

    advance();
    return redir;
}

CommandPtr Parser::makeDeclClause(CallExpr &call)
{
    auto decl = std::make_unique<DeclClause>(call.loc, call.args.front().literal());
    for (std::size_t i = 1; i < call.args.size(); ++i)
    {
        Word &word = call.args[i];
        Assign assign;
        if (splitAssignment(word, assign))
        {
            decl->assigns.push_back(std::move(assign));
            continue;
        }
        const std::string name = word.literal();
        if (isValidName(name))
        {
            assign.name = name;
            assign.loc = word.loc;
            decl->assigns.push_back(std::move(assign));
            continue;
        }
        decl->flags.push_back(std::move(word));
    }
    return decl;
}

} // namespace shgo::frontends::shell
