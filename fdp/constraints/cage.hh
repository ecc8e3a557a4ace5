#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_CAGE_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINTS_CAGE_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/value.hh>
#include <fdp/variable_id.hh>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/ostream.h>

namespace fdp
{
    /**
     * \brief How the cells of a cage combine to give its target.
     *
     * \ingroup Constraints
     */
    enum class CageOperation
    {
        Add,
        Subtract,
        Divide,
        Multiply
    };

    /**
     * \brief Constrain that the variables combine to the target under the
     * operation, as in a KenKen or FunPuzz cage.
     *
     * Add and Multiply need the sum or product of the values to equal the
     * target. Subtract is satisfied if some ordering a0, a1, ..., ak of the
     * values has a0 - a1 - ... - ak equal to the target, and Divide if some
     * ordering has a0 / a1 / ... / ak exactly equal to the target; dividing
     * by zero never satisfies.
     *
     * Each of these only depends upon the multiset of values, not their
     * order, so the table is built by evaluating every multiset drawn from
     * the union of the variables' original domains once, and then expanding
     * the ones that hold into each of their distinct orderings that fits the
     * variables' original domains.
     *
     * Throws ModelException if a sum or product of domain values does not
     * fit in a long long.
     *
     * \ingroup Constraints
     */
    [[nodiscard]] auto cage(const CSP &, std::vector<VariableID> vars, CageOperation, Value target, std::string name) -> Constraint;

    /**
     * \brief Does this multiset of values, in any order, satisfy a cage?
     * Exposed for testing. Throws ModelException on overflow, as for
     * fdp::cage().
     *
     * \ingroup Constraints
     */
    [[nodiscard]] auto cage_holds(const std::vector<Value> & values, CageOperation, Value target) -> bool;

    /**
     * \brief Convert the numeric operation codes used in FunPuzz
     * descriptions: 0 is add, 1 is subtract, 2 is divide, 3 is multiply.
     *
     * \ingroup Constraints
     */
    [[nodiscard]] auto cage_operation_from_code(long long) -> std::optional<CageOperation>;

    auto operator<<(std::ostream &, CageOperation) -> std::ostream &;
}

template <>
struct fmt::formatter<fdp::CageOperation> : ostream_formatter
{
};

#endif
