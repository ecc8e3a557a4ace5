#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VARIABLE_ID_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VARIABLE_ID_HH 1

#include <compare>
#include <cstddef>
#include <functional>

namespace fdp
{
    /**
     * \brief Identifies a Variable owned by a CSP.
     *
     * A VariableID is only meaningful for the CSP that created it, via
     * CSP::create_variable(). Two references to the same cell of a puzzle
     * must use the same VariableID.
     *
     * \sa CSP::variable()
     * \ingroup Core
     */
    struct VariableID final
    {
        unsigned long long index;

        constexpr explicit VariableID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const VariableID &) const = default;
    };

    /**
     * \brief Identifies a Constraint that has been added to a CSP.
     *
     * \sa CSP::add_constraint()
     * \sa CSP::constraint()
     * \ingroup Core
     */
    struct ConstraintID final
    {
        unsigned long long index;

        constexpr explicit ConstraintID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const ConstraintID &) const = default;
    };
}

template <>
struct std::hash<fdp::VariableID>
{
    [[nodiscard]] inline auto operator()(const fdp::VariableID & v) const noexcept -> std::size_t
    {
        return hash<unsigned long long>{}(v.index);
    }
};

template <>
struct std::hash<fdp::ConstraintID>
{
    [[nodiscard]] inline auto operator()(const fdp::ConstraintID & c) const noexcept -> std::size_t
    {
        return hash<unsigned long long>{}(c.index);
    }
};

#endif
