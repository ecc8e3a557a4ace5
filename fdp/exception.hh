#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_EXCEPTION_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_EXCEPTION_HH 1

#include <exception>
#include <string>
#include <version>

#if __has_include(<source_location>) && __cpp_lib_source_location
#  include <source_location>
#endif

namespace fdp
{
    /**
     * \brief Thrown if something has gone wrong. This usually indicates a bug,
     * for example pruning a value that is not in a domain, or restoring one
     * that was never pruned.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a switch statement is missing a case entry. This usually
     * indicates a bug.
     *
     * \ingroup Core
     */
    class NonExhaustiveSwitch : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit NonExhaustiveSwitch(const std::source_location & = std::source_location::current());
#else
        explicit NonExhaustiveSwitch();
#endif
    };

    /**
     * \brief Thrown if a model is malformed: a tuple whose arity does not
     * match its scope, a tuple value outside a variable's original domain, a
     * scope mentioning a variable the CSP does not own, a duplicate name, or
     * an unreadable puzzle description.
     *
     * These are detected while the model is being built, never during
     * propagation.
     *
     * \ingroup Core
     */
    class ModelException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit ModelException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };
}

#endif
