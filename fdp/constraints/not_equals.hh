#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_NOT_EQUALS_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_NOT_EQUALS_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/variable_id.hh>

#include <string>

namespace fdp
{
    /**
     * \brief Constrain that two variables take different values.
     *
     * \ingroup Constraints
     */
    [[nodiscard]] auto not_equals(const CSP &, VariableID v1, VariableID v2, std::string name) -> Constraint;
}

#endif
