#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CSP_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CSP_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp-fwd.hh>
#include <fdp/value.hh>
#include <fdp/variable.hh>
#include <fdp/variable_id.hh>

#include <memory>
#include <string>
#include <vector>

namespace fdp
{
    /**
     * \defgroup Core Core functionality
     */

    /**
     * \brief A constraint satisfaction problem: the variables, the constraints
     * over them, and an index from each variable to the constraints whose
     * scope contains it.
     *
     * The CSP owns its variables, so their current domains are shared state
     * for the duration of a search. Only the propagators (pruning) and the
     * search driver (assigning, and undoing prunings) change them.
     *
     * \ingroup Core
     */
    class CSP
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        explicit CSP(std::string name = "csp");

        ~CSP();

        CSP(CSP &&) noexcept;
        auto operator=(CSP &&) noexcept -> CSP &;

        CSP(const CSP &) = delete;
        auto operator=(const CSP &) -> CSP & = delete;

        ///@}

        [[nodiscard]] auto name() const -> const std::string &;

        /**
         * \name Building the model.
         * @{
         */

        /**
         * \brief Create a new variable, whose domain is exactly the given
         * values. The name must be unique within this CSP.
         */
        [[nodiscard]] auto create_variable(std::string name, std::vector<Value> domain) -> VariableID;

        /**
         * \brief Create a new variable, whose domain goes from lower to upper
         * (inclusive). The name must be unique within this CSP.
         */
        [[nodiscard]] auto create_variable(std::string name, Value lower, Value upper) -> VariableID;

        /**
         * \brief Add a constraint. Every variable in its scope must belong to
         * this CSP, and every tuple must only use values from the original
         * domains of the corresponding variables, otherwise ModelException is
         * thrown and the CSP is unchanged.
         */
        auto add_constraint(Constraint) -> ConstraintID;

        ///@}

        /**
         * \name Lookup.
         * @{
         */

        [[nodiscard]] auto variable(VariableID) -> Variable &;

        [[nodiscard]] auto variable(VariableID) const -> const Variable &;

        [[nodiscard]] auto constraint(ConstraintID) const -> const Constraint &;

        /**
         * Every variable, in creation order.
         */
        [[nodiscard]] auto all_variables() const -> const std::vector<VariableID> &;

        /**
         * Every constraint, in the order added. The ConstraintID of a
         * constraint is its index here.
         */
        [[nodiscard]] auto all_constraints() const -> const std::vector<Constraint> &;

        [[nodiscard]] auto constraints_containing(VariableID) const -> const std::vector<ConstraintID> &;

        [[nodiscard]] auto unassigned_variables() const -> std::vector<VariableID>;

        ///@}

        /**
         * Restore every pruned value and undo every assignment.
         */
        auto reset() -> void;
    };
}

#endif
