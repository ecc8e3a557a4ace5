#include <fdp/csp.hh>
#include <fdp/exception.hh>
#include <fdp/propagators.hh>

#include <ostream>

using namespace fdp;

using std::move;
using std::nullopt;
using std::optional;
using std::ostream;
using std::string;
using std::vector;

auto fdp::propagate_bt(CSP & csp, const optional<VariableID> & newly_assigned) -> PropagationResult
{
    if (! newly_assigned)
        return PropagationResult{true, {}};

    for (auto & c : csp.constraints_containing(*newly_assigned)) {
        auto & con = csp.constraint(c);
        if (0 != con.count_unassigned(csp))
            continue;

        Tuple values;
        for (auto & v : con.scope())
            values.push_back(*csp.variable(v).assigned_value());

        if (! con.check(values))
            return PropagationResult{false, {}};
    }

    return PropagationResult{true, {}};
}

auto fdp::forward_check(CSP & csp, const Constraint & con, VariableID unassigned, Prunings & prunings) -> bool
{
    auto & var = csp.variable(unassigned);

    if (var.is_assigned() || ! con.involves(unassigned))
        throw UnexpectedException{"forward checking constraint '" + con.name() + "' on variable '" + var.name() +
            "', which is not one of its unassigned variables"};

    Tuple values;
    values.reserve(con.arity());
    for (auto & v : con.scope()) {
        if (v == unassigned)
            values.push_back(Value{0});
        else if (auto val = csp.variable(v).assigned_value())
            values.push_back(*val);
        else
            throw UnexpectedException{"forward checking constraint '" + con.name() + "', but variable '" +
                csp.variable(v).name() + "' is also unassigned"};
    }

    for (auto candidate : var.current_domain()) {
        for (unsigned p = 0; p < con.arity(); ++p)
            if (con.scope()[p] == unassigned)
                values[p] = candidate;

        if (! con.check(values)) {
            var.prune_value(candidate);
            prunings.push_back(Pruning{unassigned, candidate});
            if (0 == var.current_domain_size())
                return false;
        }
    }

    return true;
}

auto fdp::propagate_fc(CSP & csp, const optional<VariableID> & newly_assigned) -> PropagationResult
{
    PropagationResult result{true, {}};

    auto check = [&](const Constraint & con) -> bool {
        auto unassigned = con.unassigned_variables(csp);
        if (1 != unassigned.size())
            return true;
        return forward_check(csp, con, unassigned.front(), result.prunings);
    };

    if (newly_assigned) {
        for (auto & c : csp.constraints_containing(*newly_assigned))
            if (! check(csp.constraint(c))) {
                result.consistent = false;
                break;
            }
    }
    else {
        for (auto & con : csp.all_constraints())
            if (! check(con)) {
                result.consistent = false;
                break;
            }
    }

    return result;
}

auto fdp::enforce_gac(CSP & csp, vector<ConstraintID> stack, Prunings & prunings) -> bool
{
    vector<bool> on_stack(csp.all_constraints().size(), false);
    for (auto & c : stack)
        on_stack[c.index] = true;

    while (! stack.empty()) {
        auto c = stack.back();
        stack.pop_back();
        on_stack[c.index] = false;

        auto & con = csp.constraint(c);
        for (auto & v : con.scope()) {
            auto & var = csp.variable(v);
            for (auto val : var.current_domain()) {
                if (con.has_support(csp, v, val))
                    continue;

                var.prune_value(val);
                prunings.push_back(Pruning{v, val});

                if (0 == var.current_domain_size())
                    return false;

                for (auto & other : csp.constraints_containing(v))
                    if (! on_stack[other.index]) {
                        on_stack[other.index] = true;
                        stack.push_back(other);
                    }
            }
        }
    }

    return true;
}

auto fdp::propagate_gac(CSP & csp, const optional<VariableID> & newly_assigned) -> PropagationResult
{
    vector<ConstraintID> stack;
    if (newly_assigned)
        stack = csp.constraints_containing(*newly_assigned);
    else
        for (unsigned long long c = 0; c < csp.all_constraints().size(); ++c)
            stack.emplace_back(c);

    // process in the order given, so the first constraint is popped first
    vector<ConstraintID> reversed(stack.rbegin(), stack.rend());

    PropagationResult result{true, {}};
    result.consistent = enforce_gac(csp, move(reversed), result.prunings);
    return result;
}

auto fdp::restore(CSP & csp, const Prunings & prunings) -> void
{
    for (auto p = prunings.rbegin(), p_end = prunings.rend(); p != p_end; ++p)
        csp.variable(p->variable).restore_value(p->value);
}

auto fdp::propagator_for(PropagationMethod method) -> Propagator
{
    switch (method) {
    case PropagationMethod::PlainBacktracking: return propagate_bt;
    case PropagationMethod::ForwardChecking: return propagate_fc;
    case PropagationMethod::GeneralisedArcConsistency: return propagate_gac;
    }

    throw NonExhaustiveSwitch{};
}

auto fdp::parse_propagation_method(const string & s) -> optional<PropagationMethod>
{
    if (s == "bt")
        return PropagationMethod::PlainBacktracking;
    else if (s == "fc")
        return PropagationMethod::ForwardChecking;
    else if (s == "gac")
        return PropagationMethod::GeneralisedArcConsistency;
    else
        return nullopt;
}

auto fdp::operator<<(ostream & s, PropagationMethod method) -> ostream &
{
    switch (method) {
    case PropagationMethod::PlainBacktracking: return s << "bt";
    case PropagationMethod::ForwardChecking: return s << "fc";
    case PropagationMethod::GeneralisedArcConsistency: return s << "gac";
    }

    throw NonExhaustiveSwitch{};
}
