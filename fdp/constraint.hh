#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINT_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CONSTRAINT_HH 1

#include <fdp/csp-fwd.hh>
#include <fdp/exception.hh>
#include <fdp/value.hh>
#include <fdp/variable_id.hh>

#include <array>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace fdp
{
    /**
     * \defgroup Extensional Extensional constraints
     */

    /**
     * \brief One value per scope position.
     *
     * \ingroup Extensional
     */
    using Tuple = std::vector<Value>;

    /**
     * \brief A tuple whose arity is known at compile time. Can be passed to
     * Constraint::add_satisfying_tuples(), which checks the arity against the
     * scope once for the whole batch.
     *
     * \ingroup Extensional
     */
    template <std::size_t arity_>
    using FixedTuple = std::array<Value, arity_>;

    /**
     * \brief A hard constraint, given as a scope and an explicit table of every
     * tuple that satisfies it.
     *
     * Tuple positions correspond to scope positions. The table is built
     * once, whilst the model is being constructed, and is never changed by
     * propagation. Queries about the current state of the scope's variables
     * need the CSP that owns them.
     *
     * \ingroup Core
     * \ingroup Extensional
     */
    class Constraint
    {
    private:
        std::string _name;
        std::vector<VariableID> _scope;
        std::vector<Tuple> _tuples;

        // tuple content hash to tuple indices, the tuples themselves live only in _tuples
        std::unordered_multimap<std::size_t, std::size_t> _tuples_by_hash;

        // for each scope position, which tuples have which value there
        std::vector<std::unordered_map<Value, std::vector<std::size_t>>> _tuples_by_position_and_value;

        auto check_arity(std::size_t) const -> void;

        [[nodiscard]] auto position_of(VariableID) const -> std::size_t;

        [[nodiscard]] auto find_tuple(const Tuple &, std::size_t hash) const -> bool;

    public:
        /**
         * \name Constructors, destructors, etc.
         */
        ///@{

        /**
         * Create a constraint with no satisfying tuples yet. A variable may
         * appear at most once in the scope.
         */
        explicit Constraint(std::string name, std::vector<VariableID> scope);

        ///@}

        [[nodiscard]] auto name() const -> const std::string &;

        [[nodiscard]] auto scope() const -> const std::vector<VariableID> &;

        [[nodiscard]] auto arity() const -> std::size_t;

        /**
         * Does the variable appear in our scope?
         */
        [[nodiscard]] auto involves(VariableID) const -> bool;

        /**
         * \name Building the table.
         */
        ///@{

        /**
         * Add a satisfying tuple. Throws ModelException if its arity does not
         * match the scope. Adding the same tuple twice has no effect.
         */
        auto add_satisfying_tuple(Tuple) -> void;

        auto add_satisfying_tuples(const std::vector<Tuple> &) -> void;

        template <std::size_t arity_>
        auto add_satisfying_tuples(const std::vector<FixedTuple<arity_>> & tuples) -> void
        {
            check_arity(arity_);
            for (auto & t : tuples)
                add_satisfying_tuple(Tuple(t.begin(), t.end()));
        }

        [[nodiscard]] auto satisfying_tuples() const -> const std::vector<Tuple> &;

        ///@}

        /**
         * \name Queries, for use by the propagators.
         */
        ///@{

        /**
         * Is this tuple, in scope order, one of our satisfying tuples?
         */
        [[nodiscard]] auto check(const Tuple & values) const -> bool;

        [[nodiscard]] auto count_unassigned(const CSP &) const -> std::size_t;

        /**
         * The unassigned variables in our scope, in scope order.
         */
        [[nodiscard]] auto unassigned_variables(const CSP &) const -> std::vector<VariableID>;

        /**
         * Is there a satisfying tuple that has the specified value for the
         * specified variable, and where every other position's value is still
         * in the current domain of that position's variable? The variable
         * must be in our scope.
         */
        [[nodiscard]] auto has_support(const CSP &, VariableID, Value) const -> bool;

        ///@}
    };
}

#endif
