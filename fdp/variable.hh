#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VARIABLE_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VARIABLE_HH 1

#include <fdp/value.hh>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fdp
{
    /**
     * \brief A finite-domain variable, tracking its original domain, what is
     * left of it, and whether it has been assigned.
     *
     * The current domain is always a subset of the original domain, and keeps
     * the original ordering. Propagators shrink it using prune_value(), and
     * only the search driver grows it back, using restore_value(), when it
     * undoes the prunings reported by a propagator.
     *
     * Assignment does not touch the pruned set: whilst a variable is assigned,
     * its current domain is just the assigned value, or is empty if that
     * value has been pruned since.
     *
     * Usually created through CSP::create_variable().
     *
     * \ingroup Core
     */
    class Variable
    {
    private:
        std::string _name;
        std::vector<Value> _original_domain;
        std::unordered_map<Value, std::size_t> _index_of;
        std::vector<bool> _present;
        std::size_t _number_present;
        std::optional<Value> _assigned_value;

        [[nodiscard]] auto index_of(Value) const -> std::optional<std::size_t>;

    public:
        /**
         * \name Constructors, destructors, etc.
         */
        ///@{

        /**
         * Create a variable whose domain is exactly the specified values, in
         * the specified order. Throws ModelException if a value is repeated.
         */
        explicit Variable(std::string name, std::vector<Value> domain);

        ///@}

        [[nodiscard]] auto name() const -> const std::string &;

        /**
         * \name Domain queries.
         */
        ///@{

        /**
         * Every value the variable could ever take, in construction order.
         */
        [[nodiscard]] auto original_domain() const -> const std::vector<Value> &;

        /**
         * The values that remain, in original order. This is a copy, so it is
         * safe to prune values whilst iterating over it.
         */
        [[nodiscard]] auto current_domain() const -> std::vector<Value>;

        [[nodiscard]] auto current_domain_size() const -> std::size_t;

        [[nodiscard]] auto in_original_domain(Value) const -> bool;

        [[nodiscard]] auto in_current_domain(Value) const -> bool;

        /**
         * Call the callback for each value in the current domain. The domain
         * must not be modified by the callback.
         */
        auto for_each_current_value(const std::function<auto(Value)->void> &) const -> void;

        ///@}

        /**
         * \name Pruning and restoring.
         */
        ///@{

        /**
         * Remove a value from the current domain. The value must currently be
         * present, otherwise UnexpectedException is thrown: a propagator that
         * prunes the same value twice would corrupt the undo trail.
         */
        auto prune_value(Value) -> void;

        /**
         * Put back a value that was previously pruned. Used only when undoing
         * prunings, never by the propagators themselves. Throws
         * UnexpectedException if the value was not pruned.
         */
        auto restore_value(Value) -> void;

        /**
         * Put back every pruned value.
         */
        auto restore_current_domain() -> void;

        ///@}

        /**
         * \name Assignment, done by the search driver.
         */
        ///@{

        /**
         * Assign a value, which must be in the current domain.
         */
        auto assign(Value) -> void;

        auto unassign() -> void;

        [[nodiscard]] auto is_assigned() const -> bool;

        [[nodiscard]] auto assigned_value() const -> std::optional<Value>;

        ///@}
    };
}

#endif
