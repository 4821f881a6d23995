//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Compound commands: brace groups, subshells, if/elif/else chains, while and
// until loops, both for-loop spellings, case clauses and `[[ ]]`.
//
//===----------------------------------------------------------------------===//

#include "frontends/shell/Parser.hpp"

namespace shgo::frontends::shell
{

CommandPtr Parser::parseBlock()
{
    auto block = std::make_unique<Block>(tok_.loc);
    advance(); // {
    block->stmts = parseStmtList({"}"});
    expectKeyword("}", "block");
    return block;
}

CommandPtr Parser::parseSubshell()
{
    auto sub = std::make_unique<Subshell>(tok_.loc);
    advance(); // (
    sub->stmts = parseStmtList({});
    expect(TokenKind::RParen, "subshell");
    return sub;
}

CommandPtr Parser::parseIf()
{
    auto clause = std::make_unique<IfClause>(tok_.loc);
    advance(); // if
    clause->cond = parseStmtList({"then"});
    if (clause->cond.empty())
        unexpected("if condition");
    expectKeyword("then", "if");
    clause->then = parseStmtList({"elif", "else", "fi"});
    parseIfTail(*clause);
    return clause;
}

/// Each `elif` becomes a nested IfClause in the else position; the closing
/// `fi` is consumed once by the innermost clause.
void Parser::parseIfTail(IfClause &clause)
{
    if (atKeyword("elif"))
    {
        auto nested = std::make_unique<IfClause>(tok_.loc);
        advance();
        nested->cond = parseStmtList({"then"});
        if (nested->cond.empty())
            unexpected("elif condition");
        expectKeyword("then", "elif");
        nested->then = parseStmtList({"elif", "else", "fi"});
        parseIfTail(*nested);
        clause.elseClause = std::move(nested);
        return;
    }

    if (atKeyword("else"))
    {
        auto tail = std::make_unique<IfClause>(tok_.loc);
        advance();
        tail->then = parseStmtList({"fi"});
        expectKeyword("fi", "if");
        clause.elseClause = std::move(tail);
        return;
    }

    expectKeyword("fi", "if");
}

CommandPtr Parser::parseWhile(bool until)
{
    auto loop = std::make_unique<WhileClause>(tok_.loc, until);
    const char *context = until ? "until" : "while";
    advance();
    loop->cond = parseStmtList({"do"});
    if (loop->cond.empty())
        unexpected(std::string(context) + " condition");
    expectKeyword("do", context);
    loop->body = parseStmtList({"done"});
    expectKeyword("done", context);
    return loop;
}

CommandPtr Parser::parseFor()
{
    auto loop = std::make_unique<ForClause>(tok_.loc);
    advance(); // for

    if (check(TokenKind::DLParen))
    {
        loop->cstyle = true;
        loop->arithText = tok_.text;
        advance();
    }
    else
    {
        if (!check(TokenKind::Word) || !isValidName(tok_.word.literal()))
            unexpected("for loop variable");
        loop->name = tok_.word.literal();
        advance();
        skipNewlines();

        if (atKeyword("in"))
        {
            loop->hasIn = true;
            advance();
            while (check(TokenKind::Word))
            {
                loop->items.push_back(std::move(tok_.word));
                advance();
            }
        }
    }

    if (check(TokenKind::Semi))
        advance();
    skipNewlines();
    expectKeyword("do", "for");
    loop->body = parseStmtList({"done"});
    expectKeyword("done", "for");
    return loop;
}

CommandPtr Parser::parseCase()
{
    auto clause = std::make_unique<CaseClause>(tok_.loc);
    advance(); // case

    if (!check(TokenKind::Word))
        unexpected("case subject");
    clause->subject = std::move(tok_.word);
    advance();
    skipNewlines();
    expectKeyword("in", "case");
    skipNewlines();

    while (!atKeyword("esac"))
    {
        if (check(TokenKind::EndOfFile))
            unexpected("case (expected 'esac')");

        CaseItem item;
        if (check(TokenKind::LParen))
            advance();
        while (true)
        {
            if (!check(TokenKind::Word))
                unexpected("case pattern");
            item.patterns.push_back(std::move(tok_.word));
            advance();
            if (!check(TokenKind::Pipe))
                break;
            advance();
        }
        expect(TokenKind::RParen, "case pattern");

        item.body = parseStmtList({"esac"});
        if (check(TokenKind::DSemi) || check(TokenKind::SemiAmp) || check(TokenKind::DSemiAmp))
            advance();
        skipNewlines();
        clause->items.push_back(std::move(item));
    }
    advance(); // esac
    return clause;
}

CommandPtr Parser::parseTestClause()
{
    auto test = std::make_unique<TestClause>(tok_.loc);
    advance(); // [[
    while (!atKeyword("]]"))
    {
        if (check(TokenKind::EndOfFile))
            unexpected("test clause (expected ']]')");
        if (check(TokenKind::Word))
            test->words.push_back(std::move(tok_.word));
        advance();
    }
    advance(); // ]]
    return test;
}

} // namespace shgo::frontends::shell
