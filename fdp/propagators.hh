#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_PROPAGATORS_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_PROPAGATORS_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/value.hh>
#include <fdp/variable_id.hh>

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/ostream.h>

namespace fdp
{
    /**
     * \defgroup Propagation Propagation strategies
     */

    /**
     * \brief A value that a propagator removed from a variable's current
     * domain.
     *
     * \ingroup Propagation
     */
    struct Pruning final
    {
        VariableID variable;
        Value value;

        [[nodiscard]] auto operator<=>(const Pruning &) const = default;
    };

    /**
     * \brief Every value a propagator removed, in the order it removed them.
     *
     * \ingroup Propagation
     */
    using Prunings = std::vector<Pruning>;

    /**
     * \brief What a propagator tells the search driver.
     *
     * If consistent is false, a constraint was violated or a domain was wiped
     * out, and prunings holds everything removed up to that point. Either
     * way, the caller must restore every reported pruning when it backtracks.
     *
     * \ingroup Propagation
     */
    struct PropagationResult final
    {
        bool consistent;
        Prunings prunings;
    };

    /**
     * \brief The signature shared by every propagation strategy. The second
     * argument is the variable the search driver has just assigned, or
     * nullopt for the call made before any assignment.
     *
     * \ingroup Propagation
     */
    using Propagator = std::function<auto(CSP &, const std::optional<VariableID> &)->PropagationResult>;

    /**
     * \brief Plain backtracking: do no pruning, but check every constraint on
     * the newly assigned variable whose scope is now fully assigned.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto propagate_bt(CSP &, const std::optional<VariableID> & newly_assigned) -> PropagationResult;

    /**
     * \brief Forward checking: for every constraint (or every constraint on
     * the newly assigned variable) with exactly one unassigned variable left,
     * remove the values of that variable which cannot extend the current
     * assignment.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto propagate_fc(CSP &, const std::optional<VariableID> & newly_assigned) -> PropagationResult;

    /**
     * \brief Forward check one constraint, all of whose variables apart from
     * the specified one are assigned. Appends anything pruned to prunings.
     * Returns false if the variable's domain is wiped out, in which case it
     * stops straight away. Throws UnexpectedException if any other variable
     * in the scope is unassigned, or if the specified one is not in the
     * scope or is already assigned.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto forward_check(CSP &, const Constraint &, VariableID unassigned, Prunings & prunings) -> bool;

    /**
     * \brief Generalised arc consistency: starting from every constraint (or
     * every constraint on the newly assigned variable), remove every value
     * with no support, until nothing changes.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto propagate_gac(CSP &, const std::optional<VariableID> & newly_assigned) -> PropagationResult;

    /**
     * \brief Run GAC to a fixpoint from the given stack of constraints, which
     * are processed last in first out. Appends anything pruned to prunings.
     * Returns false on a domain wipeout.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto enforce_gac(CSP &, std::vector<ConstraintID> stack, Prunings & prunings) -> bool;

    /**
     * \brief Put back every pruned value, most recent first.
     *
     * \ingroup Propagation
     */
    auto restore(CSP &, const Prunings &) -> void;

    /**
     * \brief The available propagation strategies.
     *
     * \ingroup Propagation
     */
    enum class PropagationMethod
    {
        PlainBacktracking,
        ForwardChecking,
        GeneralisedArcConsistency
    };

    /**
     * \brief Get the Propagator that implements this method.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto propagator_for(PropagationMethod) -> Propagator;

    /**
     * \brief Turn "bt", "fc" or "gac" into a PropagationMethod.
     *
     * \ingroup Propagation
     */
    [[nodiscard]] auto parse_propagation_method(const std::string &) -> std::optional<PropagationMethod>;

    auto operator<<(std::ostream &, PropagationMethod) -> std::ostream &;
}

template <>
struct fmt::formatter<fdp::PropagationMethod> : ostream_formatter
{
};

#endif
