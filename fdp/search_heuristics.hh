#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_SEARCH_HEURISTICS_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_SEARCH_HEURISTICS_HH 1

#include <fdp/csp.hh>
#include <fdp/solve.hh>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fdp
{
    /**
     * \defgroup SearchHeuristics Common search heuristics for fdp::solve_with
     *
     * \sa SolveCallbacks
     */

    /**
     * Variable ordering heuristics, for SolveCallbacks::branch_variable.
     *
     * \ingroup SearchHeuristics
     */
    namespace variable_order
    {
        /**
         * Used by fdp::variable_order::in_order_of() to implement a variable
         * ordering heuristic that picks the smallest variable wrt this
         * comparator.
         *
         * \ingroup SearchHeuristics
         */
        using VariableComparator = std::function<auto(const CSP &, VariableID, VariableID)->bool>;

        /**
         * Branch on the smallest non-assigned variable wrt this comparator,
         * breaking ties in favour of whichever comes first.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_order_of(std::vector<VariableID>, VariableComparator) -> BranchVariableSelector;

        /**
         * Branch on non-assigned variables in this order.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_order(std::vector<VariableID>) -> BranchVariableSelector;

        /**
         * Branch on non-assigned variables in creation order.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_order(const CSP &) -> BranchVariableSelector;

        /**
         * Branch on the non-assigned variable with smallest current domain.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto dom(const CSP &) -> BranchVariableSelector;

        /**
         * Branch on the non-assigned variable with smallest current domain,
         * tie-breaking on the number of constraints it shares with other
         * non-assigned variables.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto dom_then_deg(const CSP &) -> BranchVariableSelector;

        /**
         * Look up one of the above by its command line name: "in-order",
         * "dom", or "dom-then-deg".
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto by_name(const CSP &, const std::string &) -> std::optional<BranchVariableSelector>;
    }

    /**
     * Value ordering heuristics, for SolveCallbacks::branch_values.
     *
     * \ingroup SearchHeuristics
     */
    namespace value_order
    {
        /**
         * Try values in the order the variable's domain lists them.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_domain_order() -> BranchValueOrder;

        /**
         * Try smaller values first.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto smallest_first() -> BranchValueOrder;

        /**
         * Try larger values first.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto largest_first() -> BranchValueOrder;
    }
}

#endif
