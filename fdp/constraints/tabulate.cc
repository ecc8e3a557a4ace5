#include <fdp/constraints/tabulate.hh>
#include <fdp/csp.hh>

using namespace fdp;

using std::function;
using std::move;
using std::size_t;
using std::string;
using std::vector;

auto fdp::tabulate(const CSP & csp, string name, vector<VariableID> scope, const TuplePredicate & predicate) -> Constraint
{
    Constraint result{move(name), scope};

    Tuple current;
    current.reserve(scope.size());

    function<auto(size_t)->void> extend = [&](size_t pos) {
        if (pos == scope.size()) {
            if (predicate(current))
                result.add_satisfying_tuple(current);
            return;
        }

        for (auto & v : csp.variable(scope[pos]).original_domain()) {
            current.push_back(v);
            extend(pos + 1);
            current.pop_back();
        }
    };

    extend(0);
    return result;
}
