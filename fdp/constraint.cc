#include <fdp/constraint.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <algorithm>

#include <boost/container_hash/hash.hpp>

using namespace fdp;

using std::find;
using std::move;
using std::size_t;
using std::string;
using std::to_string;
using std::vector;

namespace
{
    auto hash_tuple(const Tuple & t) -> size_t
    {
        size_t result = 0;
        for (auto & v : t)
            boost::hash_combine(result, v.raw_value);
        return result;
    }
}

Constraint::Constraint(string name, vector<VariableID> scope) :
    _name(move(name)),
    _scope(move(scope)),
    _tuples_by_position_and_value(_scope.size())
{
    for (size_t i = 0; i < _scope.size(); ++i)
        for (size_t j = i + 1; j < _scope.size(); ++j)
            if (_scope[i] == _scope[j])
                throw ModelException{"variable appears at positions " + to_string(i) + " and " + to_string(j) +
                    " of the scope of constraint '" + _name + "'"};
}

auto Constraint::check_arity(size_t arity) const -> void
{
    if (arity != _scope.size())
        throw ModelException{"tuple of arity " + to_string(arity) + " given to constraint '" + _name +
            "', whose scope has " + to_string(_scope.size()) + " variables"};
}

auto Constraint::position_of(VariableID var) const -> size_t
{
    auto p = find(_scope.begin(), _scope.end(), var);
    if (p == _scope.end())
        throw UnexpectedException{"asked constraint '" + _name + "' about variable " + to_string(var.index) + ", which is not in its scope"};
    return p - _scope.begin();
}

auto Constraint::name() const -> const string &
{
    return _name;
}

auto Constraint::scope() const -> const vector<VariableID> &
{
    return _scope;
}

auto Constraint::arity() const -> size_t
{
    return _scope.size();
}

auto Constraint::involves(VariableID var) const -> bool
{
    return _scope.end() != find(_scope.begin(), _scope.end(), var);
}

auto Constraint::add_satisfying_tuple(Tuple t) -> void
{
    check_arity(t.size());
    auto hash = hash_tuple(t);
    if (find_tuple(t, hash))
        return;

    auto idx = _tuples.size();
    _tuples_by_hash.emplace(hash, idx);
    for (size_t p = 0; p < t.size(); ++p)
        _tuples_by_position_and_value[p][t[p]].push_back(idx);
    _tuples.push_back(move(t));
}

auto Constraint::add_satisfying_tuples(const vector<Tuple> & tuples) -> void
{
    for (auto & t : tuples)
        add_satisfying_tuple(t);
}

auto Constraint::satisfying_tuples() const -> const vector<Tuple> &
{
    return _tuples;
}

auto Constraint::find_tuple(const Tuple & values, size_t hash) const -> bool
{
    auto [first, last] = _tuples_by_hash.equal_range(hash);
    for (auto i = first; i != last; ++i)
        if (_tuples[i->second] == values)
            return true;
    return false;
}

auto Constraint::check(const Tuple & values) const -> bool
{
    return values.size() == _scope.size() && find_tuple(values, hash_tuple(values));
}

auto Constraint::count_unassigned(const CSP & csp) const -> size_t
{
    size_t result = 0;
    for (auto & v : _scope)
        if (! csp.variable(v).is_assigned())
            ++result;
    return result;
}

auto Constraint::unassigned_variables(const CSP & csp) const -> vector<VariableID>
{
    vector<VariableID> result;
    for (auto & v : _scope)
        if (! csp.variable(v).is_assigned())
            result.push_back(v);
    return result;
}

auto Constraint::has_support(const CSP & csp, VariableID var, Value val) const -> bool
{
    auto pos = position_of(var);
    auto candidates = _tuples_by_position_and_value[pos].find(val);
    if (candidates == _tuples_by_position_and_value[pos].end())
        return false;

    for (auto idx : candidates->second) {
        auto & t = _tuples[idx];
        bool consistent = true;
        for (size_t p = 0; p < _scope.size(); ++p)
            if (p != pos && ! csp.variable(_scope[p]).in_current_domain(t[p])) {
                consistent = false;
                break;
            }

        if (consistent)
            return true;
    }

    return false;
}
