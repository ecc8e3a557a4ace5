#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <deque>
#include <unordered_set>

using namespace fdp;

using std::deque;
using std::move;
using std::size_t;
using std::string;
using std::to_string;
using std::unordered_set;
using std::vector;

struct CSP::Imp
{
    string name;
    deque<Variable> variables{};
    vector<VariableID> variable_ids{};
    vector<Constraint> constraints{};
    vector<vector<ConstraintID>> constraints_by_variable{};
    unordered_set<string> names{};
};

CSP::CSP(string name) :
    _imp(new Imp{move(name)})
{
}

CSP::~CSP() = default;

CSP::CSP(CSP &&) noexcept = default;

auto CSP::operator=(CSP &&) noexcept -> CSP & = default;

auto CSP::name() const -> const string &
{
    return _imp->name;
}

auto CSP::create_variable(string name, vector<Value> domain) -> VariableID
{
    if (_imp->names.contains(name))
        throw ModelException{"duplicate variable name '" + name + "' in '" + _imp->name + "'"};

    _imp->variables.emplace_back(name, move(domain));
    _imp->names.insert(move(name));

    VariableID result{_imp->variable_ids.size()};
    _imp->variable_ids.push_back(result);
    _imp->constraints_by_variable.emplace_back();
    return result;
}

auto CSP::create_variable(string name, Value lower, Value upper) -> VariableID
{
    vector<Value> domain;
    for (auto v = lower; v <= upper; v = v + Value{1})
        domain.push_back(v);
    return create_variable(move(name), move(domain));
}

auto CSP::add_constraint(Constraint c) -> ConstraintID
{
    for (auto & v : c.scope())
        if (v.index >= _imp->variables.size())
            throw ModelException{"constraint '" + c.name() + "' mentions variable " + to_string(v.index) +
                ", which does not belong to '" + _imp->name + "'"};

    for (auto & t : c.satisfying_tuples())
        for (size_t p = 0; p < t.size(); ++p)
            if (! variable(c.scope()[p]).in_original_domain(t[p]))
                throw ModelException{"constraint '" + c.name() + "' has a tuple using value " + t[p].to_string() +
                    " for variable '" + variable(c.scope()[p]).name() + "', which is outside its domain"};

    ConstraintID result{_imp->constraints.size()};
    for (auto & v : c.scope())
        _imp->constraints_by_variable[v.index].push_back(result);
    _imp->constraints.push_back(move(c));
    return result;
}

auto CSP::variable(VariableID v) -> Variable &
{
    return _imp->variables.at(v.index);
}

auto CSP::variable(VariableID v) const -> const Variable &
{
    return _imp->variables.at(v.index);
}

auto CSP::constraint(ConstraintID c) const -> const Constraint &
{
    return _imp->constraints.at(c.index);
}

auto CSP::all_variables() const -> const vector<VariableID> &
{
    return _imp->variable_ids;
}

auto CSP::all_constraints() const -> const vector<Constraint> &
{
    return _imp->constraints;
}

auto CSP::constraints_containing(VariableID v) const -> const vector<ConstraintID> &
{
    return _imp->constraints_by_variable.at(v.index);
}

auto CSP::unassigned_variables() const -> vector<VariableID>
{
    vector<VariableID> result;
    for (auto & v : _imp->variable_ids)
        if (! variable(v).is_assigned())
            result.push_back(v);
    return result;
}

auto CSP::reset() -> void
{
    for (auto & v : _imp->variables) {
        if (v.is_assigned())
            v.unassign();
        v.restore_current_domain();
    }
}
