#include <fdp/constraints/not_equals.hh>
#include <fdp/constraints/tabulate.hh>

using namespace fdp;

using std::move;
using std::string;

auto fdp::not_equals(const CSP & csp, VariableID v1, VariableID v2, string name) -> Constraint
{
    return tabulate(csp, move(name), {v1, v2}, [](const Tuple & t) { return t[0] != t[1]; });
}
