#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_STATS_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_STATS_HH 1

#include <chrono>
#include <iosfwd>

#include <fmt/ostream.h>

namespace fdp
{
    /**
     * \brief Statistics from solving.
     *
     * \sa fdp::solve()
     * \sa fdp::solve_with()
     * \ingroup Core
     */
    struct Stats final
    {
        unsigned long long recursions = 0;
        unsigned long long failures = 0;
        unsigned long long propagations = 0;
        unsigned long long prunings = 0;
        unsigned long long solutions = 0;
        unsigned long long max_depth = 0;

        std::chrono::microseconds solve_time{0};
    };

    /**
     * \brief Stats can be written to an ostream, for convenience.
     *
     * \sa Stats
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const Stats &) -> std::ostream &;
}

template <>
struct fmt::formatter<fdp::Stats> : ostream_formatter
{
};

#endif
