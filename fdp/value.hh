#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VALUE_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_VALUE_HH 1

#include <functional>
#include <ostream>
#include <string>

#include <fmt/ostream.h>

namespace fdp
{
    /**
     * \defgroup ValueWrapper Type-safe domain values
     */

    /**
     * \brief A value that can appear in a variable's domain, wrapped for type
     * safety.
     *
     * Use fdp::operator""_v to create a literal, for example 42_v.
     *
     * \ingroup Core
     * \ingroup ValueWrapper
     */
    struct Value final
    {
        long long raw_value;

        explicit constexpr Value(long long v) :
            raw_value(v)
        {
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            return std::to_string(raw_value);
        }

        [[nodiscard]] constexpr auto operator<=>(const Value &) const = default;
    };

    ///@{
    /**
     * \name Arithmetic on values, used when tabulating arithmetic constraints.
     *
     * \ingroup ValueWrapper
     */

    [[nodiscard]] constexpr inline auto operator+(Value a, Value b) -> Value
    {
        return Value{a.raw_value + b.raw_value};
    }

    [[nodiscard]] constexpr inline auto operator-(Value a, Value b) -> Value
    {
        return Value{a.raw_value - b.raw_value};
    }

    [[nodiscard]] constexpr inline auto operator*(Value a, Value b) -> Value
    {
        return Value{a.raw_value * b.raw_value};
    }

    [[nodiscard]] constexpr inline auto operator-(Value a) -> Value
    {
        return Value{-a.raw_value};
    }

    ///@}

    /**
     * \brief A Value can be written to an ostream.
     *
     * \ingroup ValueWrapper
     */
    inline auto operator<<(std::ostream & s, Value v) -> std::ostream &
    {
        return s << v.raw_value;
    }

    /**
     * \brief Create a Value from a literal.
     *
     * \ingroup ValueWrapper
     */
    [[nodiscard]] constexpr inline auto operator"" _v(unsigned long long v) -> Value
    {
        return Value(static_cast<long long>(v));
    }
}

template <>
struct std::hash<fdp::Value>
{
    [[nodiscard]] inline auto operator()(const fdp::Value & v) const noexcept -> std::size_t
    {
        return hash<long long>{}(v.raw_value);
    }
};

template <>
struct fmt::formatter<fdp::Value> : ostream_formatter
{
};

#endif
