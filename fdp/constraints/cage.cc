#include <fdp/constraints/cage.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <fmt/core.h>

#include <algorithm>
#include <functional>
#include <ostream>
#include <set>

using namespace fdp;

using std::function;
using std::move;
using std::next_permutation;
using std::nullopt;
using std::optional;
using std::ostream;
using std::set;
using std::size_t;
using std::string;
using std::vector;

namespace
{
    auto checked_add(Value a, Value b) -> Value
    {
        long long result;
        if (__builtin_add_overflow(a.raw_value, b.raw_value, &result))
            throw ModelException{fmt::format("cage arithmetic overflows on {} + {}", a, b)};
        return Value{result};
    }

    auto checked_subtract(Value a, Value b) -> Value
    {
        long long result;
        if (__builtin_sub_overflow(a.raw_value, b.raw_value, &result))
            throw ModelException{fmt::format("cage arithmetic overflows on {} - {}", a, b)};
        return Value{result};
    }

    auto checked_multiply(Value a, Value b) -> Value
    {
        long long result;
        if (__builtin_mul_overflow(a.raw_value, b.raw_value, &result))
            throw ModelException{fmt::format("cage arithmetic overflows on {} * {}", a, b)};
        return Value{result};
    }

    auto sum_of(const vector<Value> & values) -> Value
    {
        Value result{0};
        for (auto & v : values)
            result = checked_add(result, v);
        return result;
    }

    auto product_of(const vector<Value> & values) -> Value
    {
        Value result{1};
        for (auto & v : values)
            result = checked_multiply(result, v);
        return result;
    }

    auto product_except(const vector<Value> & values, size_t skip) -> Value
    {
        Value result{1};
        for (size_t i = 0; i < values.size(); ++i)
            if (i != skip)
                result = checked_multiply(result, values[i]);
        return result;
    }
}

auto fdp::cage_holds(const vector<Value> & values, CageOperation op, Value target) -> bool
{
    switch (op) {
    case CageOperation::Add:
        return sum_of(values) == target;

    case CageOperation::Multiply:
        return product_of(values) == target;

    case CageOperation::Subtract: {
        // a0 - (a1 + ... + ak), so only the choice of a0 matters
        auto sum = sum_of(values);
        for (auto & first : values)
            if (checked_subtract(checked_add(first, first), sum) == target)
                return true;
        return false;
    }

    case CageOperation::Divide:
        // a0 / (a1 * ... * ak), compared exactly
        for (size_t i = 0; i < values.size(); ++i) {
            auto rest = product_except(values, i);
            long long scaled;
            // if target * rest overflows it cannot equal a0
            if (rest != Value{0} && ! __builtin_mul_overflow(target.raw_value, rest.raw_value, &scaled) &&
                scaled == values[i].raw_value)
                return true;
        }
        return false;
    }

    throw NonExhaustiveSwitch{};
}

auto fdp::cage(const CSP & csp, vector<VariableID> vars, CageOperation op, Value target, string name) -> Constraint
{
    Constraint result{move(name), vars};

    set<Value> all_values_set;
    for (auto & v : vars)
        for (auto & val : csp.variable(v).original_domain())
            all_values_set.insert(val);
    vector<Value> all_values(all_values_set.begin(), all_values_set.end());

    auto fits = [&](const Tuple & t) {
        for (size_t p = 0; p < vars.size(); ++p)
            if (! csp.variable(vars[p]).in_original_domain(t[p]))
                return false;
        return true;
    };

    // canonical form is non-decreasing, so each multiset is visited once
    Tuple multiset;
    function<auto(size_t)->void> extend = [&](size_t from) {
        if (multiset.size() == vars.size()) {
            if (! cage_holds(multiset, op, target))
                return;

            Tuple ordering = multiset;
            do {
                if (fits(ordering))
                    result.add_satisfying_tuple(ordering);
            } while (next_permutation(ordering.begin(), ordering.end()));
            return;
        }

        for (size_t i = from; i < all_values.size(); ++i) {
            multiset.push_back(all_values[i]);
            extend(i);
            multiset.pop_back();
        }
    };

    extend(0);
    return result;
}

auto fdp::cage_operation_from_code(long long code) -> optional<CageOperation>
{
    switch (code) {
    case 0: return CageOperation::Add;
    case 1: return CageOperation::Subtract;
    case 2: return CageOperation::Divide;
    case 3: return CageOperation::Multiply;
    default: return nullopt;
    }
}

auto fdp::operator<<(ostream & s, CageOperation op) -> ostream &
{
    switch (op) {
    case CageOperation::Add: return s << "+";
    case CageOperation::Subtract: return s << "-";
    case CageOperation::Divide: return s << "/";
    case CageOperation::Multiply: return s << "*";
    }

    throw NonExhaustiveSwitch{};
}
