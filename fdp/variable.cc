#include <fdp/exception.hh>
#include <fdp/variable.hh>

using namespace fdp;

using std::function;
using std::move;
using std::nullopt;
using std::optional;
using std::size_t;
using std::string;
using std::vector;

Variable::Variable(string name, vector<Value> domain) :
    _name(move(name)),
    _original_domain(move(domain)),
    _present(_original_domain.size(), true),
    _number_present(_original_domain.size())
{
    for (size_t idx = 0; idx < _original_domain.size(); ++idx)
        if (! _index_of.emplace(_original_domain[idx], idx).second)
            throw ModelException{"value " + _original_domain[idx].to_string() + " appears twice in the domain of '" + _name + "'"};
}

auto Variable::index_of(Value v) const -> optional<size_t>
{
    auto i = _index_of.find(v);
    if (i == _index_of.end())
        return nullopt;
    return i->second;
}

auto Variable::name() const -> const string &
{
    return _name;
}

auto Variable::original_domain() const -> const vector<Value> &
{
    return _original_domain;
}

auto Variable::current_domain() const -> vector<Value>
{
    vector<Value> result;
    for_each_current_value([&](Value v) { result.push_back(v); });
    return result;
}

auto Variable::current_domain_size() const -> size_t
{
    if (_assigned_value)
        return in_current_domain(*_assigned_value) ? 1 : 0;
    return _number_present;
}

auto Variable::in_original_domain(Value v) const -> bool
{
    return _index_of.contains(v);
}

auto Variable::in_current_domain(Value v) const -> bool
{
    auto idx = index_of(v);
    if (! idx || ! _present[*idx])
        return false;
    return (! _assigned_value) || *_assigned_value == v;
}

auto Variable::for_each_current_value(const function<auto(Value)->void> & f) const -> void
{
    if (_assigned_value) {
        if (in_current_domain(*_assigned_value))
            f(*_assigned_value);
        return;
    }

    for (size_t idx = 0; idx < _original_domain.size(); ++idx)
        if (_present[idx])
            f(_original_domain[idx]);
}

auto Variable::prune_value(Value v) -> void
{
    auto idx = index_of(v);
    if (! idx || ! _present[*idx])
        throw UnexpectedException{"pruning value " + v.to_string() + " from '" + _name + "', but it is not in the domain"};

    _present[*idx] = false;
    --_number_present;
}

auto Variable::restore_value(Value v) -> void
{
    auto idx = index_of(v);
    if (! idx)
        throw UnexpectedException{"restoring value " + v.to_string() + " to '" + _name + "', but it was never in the domain"};
    if (_present[*idx])
        throw UnexpectedException{"restoring value " + v.to_string() + " to '" + _name + "', but it was not pruned"};

    _present[*idx] = true;
    ++_number_present;
}

auto Variable::restore_current_domain() -> void
{
    _present.assign(_original_domain.size(), true);
    _number_present = _original_domain.size();
}

auto Variable::assign(Value v) -> void
{
    if (_assigned_value)
        throw UnexpectedException{"assigning " + v.to_string() + " to '" + _name + "', which is already assigned"};
    if (! in_current_domain(v))
        throw UnexpectedException{"assigning " + v.to_string() + " to '" + _name + "', which is not in its current domain"};

    _assigned_value = v;
}

auto Variable::unassign() -> void
{
    if (! _assigned_value)
        throw UnexpectedException{"unassigning '" + _name + "', which is not assigned"};

    _assigned_value = nullopt;
}

auto Variable::is_assigned() const -> bool
{
    return _assigned_value.has_value();
}

auto Variable::assigned_value() const -> optional<Value>
{
    return _assigned_value;
}
