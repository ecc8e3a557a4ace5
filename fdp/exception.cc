#include <fdp/exception.hh>

using namespace fdp;

#if __has_include(<source_location>) && __cpp_lib_source_location
using std::source_location;
using std::to_string;
#endif
using std::string;

UnexpectedException::UnexpectedException(const string & w) :
    _wat("unexpected problem: " + w)
{
}

auto UnexpectedException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

ModelException::ModelException(const string & w) :
    _wat("bad model: " + w)
{
}

auto ModelException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

#if __has_include(<source_location>) && __cpp_lib_source_location

namespace
{
    auto describe_location(const source_location & where) -> string
    {
        return string{where.file_name()} + ":" + to_string(where.line()) + " in " + string{where.function_name()};
    }
}

NonExhaustiveSwitch::NonExhaustiveSwitch(const source_location & where) :
    UnexpectedException{"non-exhaustive at " + describe_location(where)}
{
}

#else

NonExhaustiveSwitch::NonExhaustiveSwitch() :
    UnexpectedException{"non-exhaustive switch, source location not supported by your compiler"}
{
}

#endif
