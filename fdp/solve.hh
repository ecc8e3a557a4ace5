#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_SOLVE_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_SOLVE_HH 1

#include <fdp/csp.hh>
#include <fdp/propagators.hh>
#include <fdp/stats.hh>

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace fdp
{
    /**
     * \defgroup SolveCallbacks Callbacks for solving
     *
     * \sa SearchHeuristics
     */

    /**
     * \brief Called for every solution found when using fdp::solve() and
     * fdp::solve_with(), with every variable assigned. If false is returned
     * then no further solutions will be given.
     *
     * \ingroup SolveCallbacks
     */
    using SolutionCallback = std::function<auto(const CSP &)->bool>;

    /**
     * \brief Called after propagation succeeds at a node that is not a
     * solution, with the current depth, when using fdp::solve_with(). If
     * false is returned then search will stop.
     *
     * \ingroup SolveCallbacks
     */
    using TraceCallback = std::function<auto(const CSP &, unsigned long long depth)->bool>;

    /**
     * \brief Called by fdp::solve_with() to pick the next variable to branch on.
     * Returning nullopt means every variable is assigned.
     *
     * \ingroup SolveCallbacks
     * \sa SearchHeuristics
     */
    using BranchVariableSelector = std::function<auto(const CSP &)->std::optional<VariableID>>;

    /**
     * \brief Called by fdp::solve_with() to decide which values to try for the
     * chosen variable, and in which order. Should only return values from the
     * variable's current domain.
     *
     * \ingroup SolveCallbacks
     * \sa SearchHeuristics
     */
    using BranchValueOrder = std::function<auto(const CSP &, VariableID)->std::vector<Value>>;

    /**
     * \brief Called by fdp::solve_with() after the search has completed
     * successfully (not aborted due to a callback returning false, or the
     * abort flag being set).
     *
     * \ingroup SolveCallbacks
     */
    using CompletedCallback = std::function<auto()->void>;

    /**
     * \brief Callbacks for fdp::solve_with().
     *
     * Every callback is optional.
     *
     * \ingroup SolveCallbacks
     */
    struct SolveCallbacks final
    {
        SolutionCallback solution = SolutionCallback{};
        TraceCallback trace = TraceCallback{};
        BranchVariableSelector branch_variable = BranchVariableSelector{};
        BranchValueOrder branch_values = BranchValueOrder{};
        CompletedCallback completed = CompletedCallback{};
    };

    /**
     * \brief Solve a problem by backtracking search, using the given
     * propagator after every assignment, and call the provided callback for
     * each solution found.
     *
     * If the callback returns false, no further solutions will be provided.
     *
     * \ingroup Core
     * \sa SolveCallbacks
     */
    auto solve(CSP &, const Propagator &, SolutionCallback callback) -> Stats;

    /**
     * \brief Solve a problem, with callbacks for various events.
     *
     * All callback members are optional. By default we branch on the
     * variable with the smallest current domain, trying values in domain
     * order. If a solution or trace callback returns false, no further
     * solutions will be provided.
     *
     * Every assignment made and every pruning reported by the propagator is
     * undone before returning, so the CSP is left as it was found.
     *
     * If the final argument is not nullptr, the provided atomic will be
     * polled between search nodes and search will abort if it becomes true.
     *
     * \ingroup Core
     * \sa SolveCallbacks
     */
    auto solve_with(CSP &, const Propagator &, SolveCallbacks callbacks,
        std::atomic<bool> * optional_abort_flag = nullptr) -> Stats;
}

#endif
