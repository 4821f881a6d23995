//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the background-job check in two steps.  Function summaries
// (process state touched, globals read and written, jobs left running) are
// computed to a fixed point so recursion terminates.  A flow walk over each
// statement list then tracks whether a job may be running and which globals
// running jobs read.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Background job safety check.

#include "codegen/go/JobSafety.hpp"

#include "codegen/go/Splice.hpp"
#include "ir/Unsupported.hpp"

#include <map>

namespace shgo::codegen::go
{
namespace
{
/// Process-wide state a function touches, including through its callees.
struct Summary
{
    bool changesDirectory = false;
    bool swapsStreams = false;
    bool changesEnvironment = false;
    bool waits = false;
    /// Jobs it starts may still be running when it returns.
    bool leavesJobs = false;
    std::set<std::string> reads;
    std::set<std::string> writes;

    bool operator==(const Summary &) const = default;

    [[nodiscard]] const char *effect() const
    {
        if (changesDirectory)
            return "directory change";
        if (swapsStreams)
            return "redirection";
        if (changesEnvironment)
            return "environment change";
        return nullptr;
    }
};

/// Flow state at one point of a statement list.
struct State
{
    bool outstanding = false;
    /// Globals read by functions that running jobs call.
    std::set<std::string> shared;

    bool operator==(const State &) const = default;

    void join(const State &other)
    {
        outstanding = outstanding || other.outstanding;
        shared.insert(other.shared.begin(), other.shared.end());
    }
};

void wordNames(const ir::Word &word, std::set<std::string> &names)
{
    for (const auto &seg : word.segments)
    {
        if (seg.kind != ir::WordSegment::Kind::Interpolated)
            continue;
        for (const auto &token : splitInterpolated(seg.text))
        {
            if (token.reference)
                names.insert(token.text);
        }
    }
}

/// Names a `read` command assigns.
std::set<std::string> readTargets(const ir::Command &cmd)
{
    std::set<std::string> names;
    for (const auto &arg : cmd.args)
    {
        const std::string text = arg.literalText();
        if (arg.isLiteral() && !text.empty() && text.front() != '-')
            names.insert(text);
    }
    if (names.empty())
        names.insert("REPLY");
    return names;
}

bool isBuiltin(const ir::Command &cmd, const char *name)
{
    return cmd.cls == ir::CommandClass::Builtin && cmd.name == name;
}

void namesIn(const ir::StatementList &stmts, std::set<std::string> &names);

void namesIn(const ir::Statement &stmt, std::set<std::string> &names)
{
    switch (stmt.kind())
    {
        case ir::StatementKind::Command:
        {
            const auto &cmd = stmt.as<ir::Command>();
            for (const auto &arg : cmd.args)
                wordNames(arg, names);
            if (isBuiltin(cmd, "read"))
            {
                for (const auto &name : readTargets(cmd))
                    names.insert(name);
            }
            return;
        }
        case ir::StatementKind::Assignment:
        {
            const auto &assign = stmt.as<ir::Assignment>();
            names.insert(assign.name);
            if (assign.value)
                wordNames(*assign.value, names);
            return;
        }
        case ir::StatementKind::Conditional:
        {
            const auto &cond = stmt.as<ir::Conditional>();
            namesIn(cond.condition, names);
            namesIn(cond.thenBranch, names);
            for (const auto &elif : cond.elifs)
            {
                namesIn(elif.condition, names);
                namesIn(elif.body, names);
            }
            namesIn(cond.elseBranch, names);
            return;
        }
        case ir::StatementKind::Loop:
        {
            const auto &loop = stmt.as<ir::Loop>();
            if (!loop.var.empty())
                names.insert(loop.var);
            for (const auto &item : loop.items)
                wordNames(item, names);
            namesIn(loop.condition, names);
            namesIn(loop.body, names);
            return;
        }
        case ir::StatementKind::Pipeline:
            for (const auto &stage : stmt.as<ir::Pipeline>().stages)
            {
                for (const auto &arg : stage.args)
                    wordNames(arg, names);
            }
            return;
        case ir::StatementKind::Subshell:
            namesIn(stmt.as<ir::Subshell>().body, names);
            return;
        case ir::StatementKind::Redirection:
        {
            const auto &redir = stmt.as<ir::Redirection>();
            wordNames(redir.target, names);
            namesIn(*redir.statement, names);
            return;
        }
        case ir::StatementKind::Background:
            namesIn(*stmt.as<ir::Background>().statement, names);
            return;
        case ir::StatementKind::Return:
        {
            const auto &ret = stmt.as<ir::Return>();
            if (ret.value)
                wordNames(*ret.value, names);
            return;
        }
        case ir::StatementKind::Group:
            namesIn(stmt.as<ir::Group>().body, names);
            return;
        case ir::StatementKind::FunctionDecl:
            return;
    }
}

void namesIn(const ir::StatementList &stmts, std::set<std::string> &names)
{
    for (const auto &stmt : stmts)
        namesIn(stmt, names);
}

class JobChecker
{
  public:
    explicit JobChecker(const ir::Program &program) : program_(program) {}

    void run()
    {
        summarizeFunctions();

        report_ = true;
        for (const auto &fn : program_.functions())
        {
            State state;
            flow(fn.body, &fn, state, false);
        }
        State state;
        flow(program_.statements, nullptr, state, false);
    }

  private:
    void summarizeFunctions()
    {
        report_ = false;
        bool changed = true;
        while (changed)
        {
            changed = false;
            for (const auto &fn : program_.functions())
            {
                Summary summary;
                summarize(fn.body, &fn, summary, false);
                State state;
                flow(fn.body, &fn, state, false);
                summary.leavesJobs = state.outstanding;

                Summary &slot = summaries_[fn.name];
                if (slot != summary)
                {
                    slot = std::move(summary);
                    changed = true;
                }
            }
        }
    }

    [[nodiscard]] const Summary &summaryOf(const std::string &name) const
    {
        static const Summary none;
        const auto it = summaries_.find(name);
        return it == summaries_.end() ? none : it->second;
    }

    [[nodiscard]] bool isGlobal(const std::string &name, const ir::Function *fn) const
    {
        if (fn != nullptr && fn->locals.count(name) != 0)
            return false;
        return program_.variables.count(name) != 0;
    }

    void globalsOf(const ir::Word &word, const ir::Function *fn, std::set<std::string> &out) const
    {
        std::set<std::string> names;
        wordNames(word, names);
        for (const auto &name : names)
        {
            if (isGlobal(name, fn))
                out.insert(name);
        }
    }

    //=========================================================================
    // Summaries
    //=========================================================================

    void summarize(const ir::StatementList &stmts, const ir::Function *fn, Summary &sum,
                   bool shadowed)
    {
        for (const auto &stmt : stmts)
            summarize(stmt, fn, sum, shadowed);
    }

    /// @p shadowed: assignments land in a private copy (subshell or job).
    void summarize(const ir::Statement &stmt, const ir::Function *fn, Summary &sum, bool shadowed)
    {
        auto write = [&](const std::string &name)
        {
            if (!shadowed && isGlobal(name, fn))
                sum.writes.insert(name);
        };

        switch (stmt.kind())
        {
            case ir::StatementKind::Command:
            {
                const auto &cmd = stmt.as<ir::Command>();
                for (const auto &arg : cmd.args)
                    globalsOf(arg, fn, sum.reads);
                if (cmd.cls == ir::CommandClass::Function)
                {
                    const Summary &callee = summaryOf(cmd.name);
                    sum.changesDirectory = sum.changesDirectory || callee.changesDirectory;
                    sum.swapsStreams = sum.swapsStreams || callee.swapsStreams;
                    sum.changesEnvironment = sum.changesEnvironment || callee.changesEnvironment;
                    sum.waits = sum.waits || callee.waits;
                    sum.reads.insert(callee.reads.begin(), callee.reads.end());
                    sum.writes.insert(callee.writes.begin(), callee.writes.end());
                }
                else if (isBuiltin(cmd, "cd"))
                {
                    sum.changesDirectory = true;
                }
                else if (isBuiltin(cmd, "export"))
                {
                    sum.changesEnvironment = true;
                }
                else if (isBuiltin(cmd, "wait"))
                {
                    sum.waits = true;
                }
                else if (isBuiltin(cmd, "read"))
                {
                    for (const auto &name : readTargets(cmd))
                        write(name);
                }
                return;
            }
            case ir::StatementKind::Assignment:
            {
                const auto &assign = stmt.as<ir::Assignment>();
                if (assign.value)
                    globalsOf(*assign.value, fn, sum.reads);
                sum.changesEnvironment = sum.changesEnvironment || assign.isExport;
                write(assign.name);
                return;
            }
            case ir::StatementKind::Conditional:
            {
                const auto &cond = stmt.as<ir::Conditional>();
                summarize(cond.condition, fn, sum, shadowed);
                summarize(cond.thenBranch, fn, sum, shadowed);
                for (const auto &elif : cond.elifs)
                {
                    summarize(elif.condition, fn, sum, shadowed);
                    summarize(elif.body, fn, sum, shadowed);
                }
                summarize(cond.elseBranch, fn, sum, shadowed);
                return;
            }
            case ir::StatementKind::Loop:
            {
                const auto &loop = stmt.as<ir::Loop>();
                if (!loop.var.empty())
                    write(loop.var);
                for (const auto &item : loop.items)
                    globalsOf(item, fn, sum.reads);
                summarize(loop.condition, fn, sum, shadowed);
                summarize(loop.body, fn, sum, shadowed);
                return;
            }
            case ir::StatementKind::Pipeline:
                for (const auto &stage : stmt.as<ir::Pipeline>().stages)
                {
                    for (const auto &arg : stage.args)
                        globalsOf(arg, fn, sum.reads);
                }
                return;
            case ir::StatementKind::Subshell:
                summarize(stmt.as<ir::Subshell>().body, fn, sum, true);
                return;
            case ir::StatementKind::Redirection:
            {
                const auto &redir = stmt.as<ir::Redirection>();
                sum.swapsStreams = true;
                globalsOf(redir.target, fn, sum.reads);
                summarize(*redir.statement, fn, sum, shadowed);
                return;
            }
            case ir::StatementKind::Background:
                summarize(*stmt.as<ir::Background>().statement, fn, sum, true);
                return;
            case ir::StatementKind::Return:
            {
                const auto &ret = stmt.as<ir::Return>();
                if (ret.value)
                    globalsOf(*ret.value, fn, sum.reads);
                return;
            }
            case ir::StatementKind::Group:
                summarize(stmt.as<ir::Group>().body, fn, sum, shadowed);
                return;
            case ir::StatementKind::FunctionDecl:
                return;
        }
    }

    //=========================================================================
    // Background units
    //=========================================================================

    void fail(const support::SourceLoc &loc, const std::string &what) const
    {
        if (report_)
            ir::unsupported(loc, what);
    }

    /// Check one background unit; returns the globals its callees read.
    std::set<std::string> checkJob(const ir::Statement &unit)
    {
        std::set<std::string> reads;
        checkJob(unit, reads);
        return reads;
    }

    void checkJob(const ir::StatementList &stmts, std::set<std::string> &reads)
    {
        for (const auto &stmt : stmts)
            checkJob(stmt, reads);
    }

    void checkJob(const ir::Statement &stmt, std::set<std::string> &reads)
    {
        switch (stmt.kind())
        {
            case ir::StatementKind::Command:
            {
                const auto &cmd = stmt.as<ir::Command>();
                if (cmd.cls == ir::CommandClass::Function)
                {
                    const Summary &callee = summaryOf(cmd.name);
                    if (const char *effect = callee.effect())
                    {
                        fail(stmt.loc, std::string(effect) + " in '" + cmd.name +
                                           "' inside a background job");
                    }
                    if (callee.waits)
                        fail(stmt.loc, "'wait' in '" + cmd.name + "' inside a background job");
                    if (!callee.writes.empty())
                    {
                        fail(stmt.loc, "assignment to global '" + *callee.writes.begin() +
                                           "' in '" + cmd.name + "' inside a background job");
                    }
                    reads.insert(callee.reads.begin(), callee.reads.end());
                }
                else if (isBuiltin(cmd, "cd"))
                {
                    fail(stmt.loc, "directory change inside a background job");
                }
                else if (isBuiltin(cmd, "export"))
                {
                    fail(stmt.loc, "environment change inside a background job");
                }
                else if (isBuiltin(cmd, "wait"))
                {
                    fail(stmt.loc, "'wait' inside a background job");
                }
                return;
            }
            case ir::StatementKind::Assignment:
                if (stmt.as<ir::Assignment>().isExport)
                    fail(stmt.loc, "environment change inside a background job");
                return;
            case ir::StatementKind::Conditional:
            {
                const auto &cond = stmt.as<ir::Conditional>();
                checkJob(cond.condition, reads);
                checkJob(cond.thenBranch, reads);
                for (const auto &elif : cond.elifs)
                {
                    checkJob(elif.condition, reads);
                    checkJob(elif.body, reads);
                }
                checkJob(cond.elseBranch, reads);
                return;
            }
            case ir::StatementKind::Loop:
            {
                const auto &loop = stmt.as<ir::Loop>();
                checkJob(loop.condition, reads);
                checkJob(loop.body, reads);
                return;
            }
            case ir::StatementKind::Subshell:
                checkJob(stmt.as<ir::Subshell>().body, reads);
                return;
            case ir::StatementKind::Redirection:
                fail(stmt.loc, "redirection inside a background job");
                checkJob(*stmt.as<ir::Redirection>().statement, reads);
                return;
            case ir::StatementKind::Background:
                checkJob(*stmt.as<ir::Background>().statement, reads);
                return;
            case ir::StatementKind::Group:
                checkJob(stmt.as<ir::Group>().body, reads);
                return;
            case ir::StatementKind::Pipeline:
            case ir::StatementKind::Return:
            case ir::StatementKind::FunctionDecl:
                return;
        }
    }

    //=========================================================================
    // Foreground flow
    //=========================================================================

    void checkWrite(const std::string &name, const ir::Function *fn, const State &state,
                    const support::SourceLoc &loc, bool shadowed) const
    {
        if (shadowed || !isGlobal(name, fn) || state.shared.count(name) == 0)
            return;
        fail(loc, "assignment to '" + name + "' while a background job that reads it may be running");
    }

    void flow(const ir::StatementList &stmts, const ir::Function *fn, State &state, bool shadowed)
    {
        for (const auto &stmt : stmts)
            flow(stmt, fn, state, shadowed);
    }

    void flow(const ir::Statement &stmt, const ir::Function *fn, State &state, bool shadowed)
    {
        const std::string running = " while a background job may be running";
        switch (stmt.kind())
        {
            case ir::StatementKind::Command:
            {
                const auto &cmd = stmt.as<ir::Command>();
                if (cmd.cls == ir::CommandClass::Function)
                {
                    const Summary &callee = summaryOf(cmd.name);
                    if (state.outstanding)
                    {
                        if (const char *effect = callee.effect())
                            fail(stmt.loc, std::string(effect) + " in '" + cmd.name + "'" + running);
                        for (const auto &name : callee.writes)
                        {
                            if (state.shared.count(name) != 0)
                            {
                                fail(stmt.loc, "assignment to '" + name + "' in '" + cmd.name +
                                                   "' while a background job that reads it may "
                                                   "be running");
                            }
                        }
                    }
                    if (callee.leavesJobs)
                    {
                        state.outstanding = true;
                        state.shared.insert(callee.reads.begin(), callee.reads.end());
                    }
                    return;
                }
                if (!state.outstanding)
                    return;
                if (isBuiltin(cmd, "cd"))
                {
                    fail(stmt.loc, "directory change" + running);
                }
                else if (isBuiltin(cmd, "export"))
                {
                    fail(stmt.loc, "environment change" + running);
                }
                else if (isBuiltin(cmd, "wait"))
                {
                    state = State();
                }
                else if (isBuiltin(cmd, "read"))
                {
                    for (const auto &name : readTargets(cmd))
                        checkWrite(name, fn, state, stmt.loc, shadowed);
                }
                return;
            }
            case ir::StatementKind::Assignment:
            {
                const auto &assignment = stmt.as<ir::Assignment>();
                if (state.outstanding && assignment.isExport)
                    fail(stmt.loc, "environment change" + running);
                checkWrite(assignment.name, fn, state, stmt.loc, shadowed);
                return;
            }
            case ir::StatementKind::Conditional:
            {
                const auto &cond = stmt.as<ir::Conditional>();
                State current = state;
                flow(cond.condition, fn, current, shadowed);
                State result = current;
                flow(cond.thenBranch, fn, result, shadowed);
                for (const auto &elif : cond.elifs)
                {
                    flow(elif.condition, fn, current, shadowed);
                    State branch = current;
                    flow(elif.body, fn, branch, shadowed);
                    result.join(branch);
                }
                flow(cond.elseBranch, fn, current, shadowed);
                result.join(current);
                state = std::move(result);
                return;
            }
            case ir::StatementKind::Loop:
            {
                const auto &loop = stmt.as<ir::Loop>();
                State head = state;
                while (true)
                {
                    State iteration = head;
                    if (!loop.var.empty())
                        checkWrite(loop.var, fn, iteration, stmt.loc, shadowed);
                    flow(loop.condition, fn, iteration, shadowed);
                    flow(loop.body, fn, iteration, shadowed);
                    State joined = head;
                    joined.join(iteration);
                    if (joined == head)
                        break;
                    head = std::move(joined);
                }
                state = std::move(head);
                return;
            }
            case ir::StatementKind::Subshell:
                flow(stmt.as<ir::Subshell>().body, fn, state, true);
                return;
            case ir::StatementKind::Redirection:
                if (state.outstanding)
                    fail(stmt.loc, "redirection" + running);
                flow(*stmt.as<ir::Redirection>().statement, fn, state, shadowed);
                return;
            case ir::StatementKind::Background:
            {
                const std::set<std::string> reads = checkJob(*stmt.as<ir::Background>().statement);
                state.outstanding = true;
                state.shared.insert(reads.begin(), reads.end());
                return;
            }
            case ir::StatementKind::Group:
                flow(stmt.as<ir::Group>().body, fn, state, shadowed);
                return;
            case ir::StatementKind::Pipeline:
            case ir::StatementKind::Return:
            case ir::StatementKind::FunctionDecl:
                return;
        }
    }

    const ir::Program &program_;
    std::map<std::string, Summary> summaries_;
    bool report_ = false;
};
} // namespace

void checkJobSafety(const ir::Program &program)
{
    if (program.capabilities.count(ir::Capability::Concurrency) == 0)
        return;
    JobChecker(program).run();
}

std::set<std::string> jobNames(const ir::Statement &unit)
{
    std::set<std::string> names;
    namesIn(unit, names);
    return names;
}

} // namespace shgo::codegen::go
