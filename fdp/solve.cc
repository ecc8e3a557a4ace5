#include <fdp/exception.hh>
#include <fdp/search_heuristics.hh>
#include <fdp/solve.hh>

#include <algorithm>

using namespace fdp;

using std::atomic;
using std::max;
using std::move;
using std::nullopt;
using std::optional;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::steady_clock;

namespace
{
    struct SearchSession
    {
        CSP & csp;
        const Propagator & propagator;
        SolveCallbacks & callbacks;
        Stats & stats;
        atomic<bool> * optional_abort_flag;

        [[nodiscard]] auto aborted() const -> bool
        {
            return optional_abort_flag && optional_abort_flag->load();
        }

        [[nodiscard]] auto propagate(const optional<VariableID> & newly_assigned) -> PropagationResult
        {
            ++stats.propagations;
            auto result = propagator(csp, newly_assigned);
            stats.prunings += result.prunings.size();
            return result;
        }
    };

    // returns false if search should stop
    auto solve_with_session(unsigned long long depth, SearchSession & session, bool & this_subtree_contains_solution) -> bool
    {
        auto & stats = session.stats;
        stats.max_depth = max(stats.max_depth, depth);
        ++stats.recursions;

        auto branch_var = session.callbacks.branch_variable(session.csp);
        if (! branch_var) {
            ++stats.solutions;
            this_subtree_contains_solution = true;
            if (session.callbacks.solution && ! session.callbacks.solution(session.csp))
                return false;
            return true;
        }

        if (session.callbacks.trace && ! session.callbacks.trace(session.csp, depth))
            return false;

        auto & var = session.csp.variable(*branch_var);
        for (auto val : session.callbacks.branch_values(session.csp, *branch_var)) {
            if (session.aborted())
                return false;

            var.assign(val);

            Prunings prunings;
            bool keep_going = true, child_contains_solution = false;
            try {
                auto [consistent, these_prunings] = session.propagate(*branch_var);
                prunings = move(these_prunings);
                if (consistent)
                    keep_going = solve_with_session(depth + 1, session, child_contains_solution);
            }
            catch (...) {
                // leave the csp as we found it, then let the caller see the problem
                restore(session.csp, prunings);
                var.unassign();
                throw;
            }

            if (child_contains_solution)
                this_subtree_contains_solution = true;
            else
                ++stats.failures;

            restore(session.csp, prunings);
            var.unassign();

            if (! keep_going)
                return false;
        }

        return true;
    }
}

auto fdp::solve(CSP & csp, const Propagator & propagator, SolutionCallback callback) -> Stats
{
    return solve_with(csp, propagator, SolveCallbacks{.solution = move(callback)});
}

auto fdp::solve_with(CSP & csp, const Propagator & propagator, SolveCallbacks callbacks,
    atomic<bool> * optional_abort_flag) -> Stats
{
    Stats stats;
    auto start_time = steady_clock::now();

    if (! callbacks.branch_variable)
        callbacks.branch_variable = variable_order::dom(csp);
    if (! callbacks.branch_values)
        callbacks.branch_values = value_order::in_domain_order();

    for (auto & v : csp.all_variables())
        if (csp.variable(v).is_assigned())
            throw UnexpectedException{"starting search with variable '" + csp.variable(v).name() + "' already assigned"};

    SearchSession session{csp, propagator, callbacks, stats, optional_abort_flag};

    auto [consistent, initial_prunings] = session.propagate(nullopt);
    bool completed = true;
    if (consistent) {
        bool child_contains_solution = false;
        try {
            completed = solve_with_session(0, session, child_contains_solution);
        }
        catch (...) {
            restore(csp, initial_prunings);
            throw;
        }
    }

    restore(csp, initial_prunings);

    if (completed && callbacks.completed)
        callbacks.completed();

    stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
    return stats;
}
