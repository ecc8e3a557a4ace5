#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_ALL_DIFFERENT_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_ALL_DIFFERENT_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/variable_id.hh>

#include <string>
#include <vector>

namespace fdp
{
    /**
     * \defgroup Constraints Constraints
     */

    /**
     * \brief Constrain that each variable takes a different value.
     *
     * Tuples are enumerated without ever extending a partial tuple that
     * already repeats a value, so the table is built in time proportional to
     * its size rather than to the full Cartesian product.
     *
     * \ingroup Constraints
     */
    [[nodiscard]] auto all_different(const CSP &, std::vector<VariableID> vars, std::string name) -> Constraint;
}

#endif
