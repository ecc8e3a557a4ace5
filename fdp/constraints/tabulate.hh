#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_TABULATE_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_TABULATE_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/variable_id.hh>

#include <functional>
#include <string>
#include <vector>

namespace fdp
{
    /**
     * \brief Decides whether a complete tuple, in scope order, satisfies a
     * constraint.
     *
     * \ingroup Extensional
     */
    using TuplePredicate = std::function<auto(const Tuple &)->bool>;

    /**
     * \brief Build a Constraint by evaluating the predicate on every tuple in
     * the Cartesian product of the scope variables' original domains, and
     * keeping the ones it accepts.
     *
     * The CSP is only used to look up the variables' domains; the result
     * still needs to be passed to CSP::add_constraint().
     *
     * \ingroup Extensional
     */
    [[nodiscard]] auto tabulate(const CSP &, std::string name, std::vector<VariableID> scope,
        const TuplePredicate &) -> Constraint;
}

#endif
