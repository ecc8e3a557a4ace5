#include <fdp/constraints/all_different.hh>
#include <fdp/csp.hh>

#include <functional>
#include <unordered_set>

using namespace fdp;

using std::function;
using std::move;
using std::size_t;
using std::string;
using std::unordered_set;
using std::vector;

auto fdp::all_different(const CSP & csp, vector<VariableID> vars, string name) -> Constraint
{
    Constraint result{move(name), vars};

    Tuple current;
    unordered_set<Value> used;

    function<auto(size_t)->void> extend = [&](size_t pos) {
        if (pos == vars.size()) {
            result.add_satisfying_tuple(current);
            return;
        }

        for (auto & v : csp.variable(vars[pos]).original_domain()) {
            if (! used.insert(v).second)
                continue;
            current.push_back(v);
            extend(pos + 1);
            current.pop_back();
            used.erase(v);
        }
    };

    extend(0);
    return result;
}
