#include <fdp/search_heuristics.hh>

#include <algorithm>
#include <functional>

using std::greater;
using std::move;
using std::nullopt;
using std::optional;
using std::size_t;
using std::sort;
using std::string;
using std::vector;

using namespace fdp;

namespace
{
    auto degree(const CSP & csp, VariableID var) -> size_t
    {
        size_t result = 0;
        for (auto & c : csp.constraints_containing(var)) {
            auto & con = csp.constraint(c);
            for (auto & other : con.scope())
                if (other != var && ! csp.variable(other).is_assigned()) {
                    ++result;
                    break;
                }
        }
        return result;
    }
}

auto fdp::variable_order::in_order_of(vector<VariableID> vars, VariableComparator comp) -> BranchVariableSelector
{
    return [vars = move(vars), comp = move(comp)](const CSP & csp) -> optional<VariableID> {
        optional<VariableID> result;
        for (auto & v : vars) {
            if (csp.variable(v).is_assigned())
                continue;
            if ((! result) || comp(csp, v, *result))
                result = v;
        }
        return result;
    };
}

auto fdp::variable_order::in_order(vector<VariableID> vars) -> BranchVariableSelector
{
    return [vars = move(vars)](const CSP & csp) -> optional<VariableID> {
        for (auto & v : vars)
            if (! csp.variable(v).is_assigned())
                return v;
        return nullopt;
    };
}

auto fdp::variable_order::in_order(const CSP & csp) -> BranchVariableSelector
{
    return in_order(csp.all_variables());
}

auto fdp::variable_order::dom(const CSP & csp) -> BranchVariableSelector
{
    return in_order_of(csp.all_variables(), [](const CSP & s, VariableID a, VariableID b) {
        return s.variable(a).current_domain_size() < s.variable(b).current_domain_size();
    });
}

auto fdp::variable_order::dom_then_deg(const CSP & csp) -> BranchVariableSelector
{
    return in_order_of(csp.all_variables(), [](const CSP & s, VariableID a, VariableID b) {
        auto a_size = s.variable(a).current_domain_size(), b_size = s.variable(b).current_domain_size();
        return a_size < b_size || (a_size == b_size && degree(s, a) > degree(s, b));
    });
}

auto fdp::variable_order::by_name(const CSP & csp, const string & name) -> optional<BranchVariableSelector>
{
    if (name == "in-order")
        return in_order(csp);
    else if (name == "dom")
        return dom(csp);
    else if (name == "dom-then-deg")
        return dom_then_deg(csp);
    else
        return nullopt;
}

auto fdp::value_order::in_domain_order() -> BranchValueOrder
{
    return [](const CSP & csp, VariableID var) -> vector<Value> {
        return csp.variable(var).current_domain();
    };
}

auto fdp::value_order::smallest_first() -> BranchValueOrder
{
    return [](const CSP & csp, VariableID var) -> vector<Value> {
        auto result = csp.variable(var).current_domain();
        sort(result.begin(), result.end());
        return result;
    };
}

auto fdp::value_order::largest_first() -> BranchValueOrder
{
    return [](const CSP & csp, VariableID var) -> vector<Value> {
        auto result = csp.variable(var).current_domain();
        sort(result.begin(), result.end(), greater<Value>{});
        return result;
    };
}
