#include <fdp/fdp.hh>

#include <catch2/catch_test_macros.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <set>
#include <tuple>
#include <vector>

using namespace fdp;

using std::find;
using std::nullopt;
using std::set;
using std::tuple;
using std::vector;

using fmt::format;

namespace
{
    auto latin_square(CSP & csp, int size, bool use_all_different) -> vector<vector<VariableID>>
    {
        vector<vector<VariableID>> grid;
        for (int r = 0; r < size; ++r) {
            grid.emplace_back();
            for (int c = 0; c < size; ++c)
                grid.back().push_back(csp.create_variable(format("V{}{}", r, c), 1_v, Value{size}));
        }

        for (int i = 0; i < size; ++i) {
            if (use_all_different) {
                vector<VariableID> row, col;
                for (int j = 0; j < size; ++j) {
                    row.push_back(grid[i][j]);
                    col.push_back(grid[j][i]);
                }
                csp.add_constraint(all_different(csp, row, format("row {}", i)));
                csp.add_constraint(all_different(csp, col, format("col {}", i)));
            }
            else
                for (int j = 0; j < size; ++j)
                    for (int k = j + 1; k < size; ++k) {
                        csp.add_constraint(not_equals(csp, grid[i][j], grid[i][k], format("row {} {} {}", i, j, k)));
                        csp.add_constraint(not_equals(csp, grid[j][i], grid[k][i], format("col {} {} {}", i, j, k)));
                    }
        }

        return grid;
    }

    auto domains(const CSP & csp) -> vector<vector<Value>>
    {
        vector<vector<Value>> result;
        for (auto & v : csp.all_variables())
            result.push_back(csp.variable(v).current_domain());
        return result;
    }

    auto contains(const Prunings & prunings, VariableID var, Value val) -> bool
    {
        return prunings.end() != find(prunings.begin(), prunings.end(), Pruning{var, val});
    }

    auto all_methods() -> vector<PropagationMethod>
    {
        return {PropagationMethod::PlainBacktracking, PropagationMethod::ForwardChecking,
            PropagationMethod::GeneralisedArcConsistency};
    }
}

TEST_CASE("Plain backtracking detects a violated constraint")
{
    CSP csp;
    auto x = csp.create_variable("X", 1_v, 2_v);
    auto y = csp.create_variable("Y", 1_v, 2_v);
    csp.add_constraint(not_equals(csp, x, y, "X != Y"));

    csp.variable(x).assign(1_v);
    auto [ok_after_x, prunings_after_x] = propagate_bt(csp, x);
    CHECK(ok_after_x);
    CHECK(prunings_after_x.empty());

    csp.variable(y).assign(1_v);
    auto [consistent, prunings] = propagate_bt(csp, y);
    CHECK(! consistent);
    CHECK(prunings.empty());
    CHECK(csp.variable(y).current_domain() == vector{1_v});

    csp.variable(y).unassign();
    csp.variable(y).assign(2_v);
    CHECK(propagate_bt(csp, y).consistent);
}

TEST_CASE("Forward checking detects a wipeout")
{
    CSP csp;
    auto x = csp.create_variable("X", vector{1_v});
    auto y = csp.create_variable("Y", vector{1_v});
    auto z = csp.create_variable("Z", vector{1_v});
    csp.add_constraint(all_different(csp, {x, y}, "X Y"));
    auto yz = csp.add_constraint(not_equals(csp, y, z, "Y != Z"));

    csp.variable(x).assign(1_v);
    csp.variable(y).assign(1_v);

    SECTION("Through the propagator")
    {
        auto [consistent, prunings] = propagate_fc(csp, y);
        CHECK(! consistent);
        CHECK(prunings == Prunings{Pruning{z, 1_v}});
        CHECK(csp.variable(z).current_domain().empty());

        restore(csp, prunings);
        CHECK(csp.variable(z).current_domain() == vector{1_v});
    }

    SECTION("Checking one constraint")
    {
        Prunings prunings;
        CHECK(! forward_check(csp, csp.constraint(yz), z, prunings));
        CHECK(contains(prunings, z, 1_v));
    }
}

TEST_CASE("Forward checking needs exactly one unassigned variable")
{
    CSP csp;
    auto x = csp.create_variable("X", 1_v, 3_v);
    auto y = csp.create_variable("Y", 1_v, 3_v);
    auto z = csp.create_variable("Z", 1_v, 3_v);
    auto xy = csp.add_constraint(not_equals(csp, x, y, "X != Y"));

    Prunings prunings;
    CHECK_THROWS_AS(forward_check(csp, csp.constraint(xy), y, prunings), UnexpectedException);
    CHECK_THROWS_AS(forward_check(csp, csp.constraint(xy), z, prunings), UnexpectedException);

    csp.variable(x).assign(2_v);
    csp.variable(y).assign(1_v);
    CHECK_THROWS_AS(forward_check(csp, csp.constraint(xy), y, prunings), UnexpectedException);

    csp.variable(y).unassign();
    CHECK(forward_check(csp, csp.constraint(xy), y, prunings));
    CHECK(prunings == Prunings{Pruning{y, 2_v}});
    CHECK(csp.variable(y).current_domain() == vector{1_v, 3_v});
}

TEST_CASE("Forward checking prunes only unsupported values")
{
    CSP csp;
    auto grid = latin_square(csp, 3, false);
    csp.variable(grid[0][0]).assign(2_v);

    auto [consistent, prunings] = propagate_fc(csp, grid[0][0]);
    CHECK(consistent);
    CHECK(prunings.size() == 4);
    for (auto & v : {grid[0][1], grid[0][2], grid[1][0], grid[2][0]}) {
        CHECK(contains(prunings, v, 2_v));
        CHECK(csp.variable(v).current_domain() == vector{1_v, 3_v});
    }
    CHECK(csp.variable(grid[1][1]).current_domain_size() == 3);

    // every removed value breaks some constraint with only that variable unassigned
    for (auto & [var, val] : prunings) {
        bool justified = false;
        for (auto & c : csp.constraints_containing(var)) {
            auto & con = csp.constraint(c);
            if (con.unassigned_variables(csp) != vector{var})
                continue;
            Tuple values;
            for (auto & s : con.scope())
                values.push_back(s == var ? val : *csp.variable(s).assigned_value());
            if (! con.check(values))
                justified = true;
        }
        CHECK(justified);
    }
}

TEST_CASE("GAC on a two by two grid")
{
    CSP csp;
    auto grid = latin_square(csp, 2, true);

    csp.variable(grid[0][0]).assign(1_v);
    auto [consistent, prunings] = propagate_gac(csp, grid[0][0]);

    CHECK(consistent);
    CHECK(contains(prunings, grid[0][1], 1_v));
    CHECK(contains(prunings, grid[1][0], 1_v));
    CHECK(csp.variable(grid[0][1]).current_domain() == vector{2_v});
    CHECK(csp.variable(grid[1][0]).current_domain() == vector{2_v});
    CHECK(csp.variable(grid[1][1]).current_domain() == vector{1_v});

    auto [again_consistent, again_prunings] = propagate_gac(csp, nullopt);
    CHECK(again_consistent);
    CHECK(again_prunings.empty());
}

TEST_CASE("GAC detects a wipeout that forward checking misses")
{
    CSP csp;
    auto x = csp.create_variable("X", 1_v, 2_v);
    auto y = csp.create_variable("Y", 1_v, 2_v);
    auto z = csp.create_variable("Z", 1_v, 2_v);
    csp.add_constraint(not_equals(csp, x, y, "X != Y"));
    csp.add_constraint(not_equals(csp, y, z, "Y != Z"));
    csp.add_constraint(not_equals(csp, x, z, "X != Z"));

    auto fc = propagate_fc(csp, nullopt);
    CHECK(fc.consistent);
    CHECK(fc.prunings.empty());

    csp.variable(x).assign(1_v);
    auto fc_after = propagate_fc(csp, x);
    CHECK(fc_after.consistent);
    CHECK(fc_after.prunings.size() == 2);
    restore(csp, fc_after.prunings);

    auto gac = propagate_gac(csp, x);
    CHECK(! gac.consistent);

    restore(csp, gac.prunings);
    CHECK(domains(csp) == vector<vector<Value>>{{1_v}, {1_v, 2_v}, {1_v, 2_v}});
}

TEST_CASE("GAC reaches a fixpoint")
{
    CSP csp;
    auto grid = latin_square(csp, 4, true);
    csp.variable(grid[0][0]).prune_value(1_v);
    csp.variable(grid[0][1]).prune_value(1_v);
    csp.variable(grid[0][2]).prune_value(1_v);
    csp.variable(grid[1][1]).prune_value(2_v);
    csp.variable(grid[2][1]).prune_value(2_v);
    csp.variable(grid[3][1]).prune_value(2_v);

    auto [consistent, prunings] = propagate_gac(csp, nullopt);
    REQUIRE(consistent);
    CHECK(csp.variable(grid[0][3]).current_domain() == vector{1_v});
    CHECK(csp.variable(grid[0][1]).current_domain() == vector{2_v});

    for (auto & c : csp.all_constraints())
        for (auto & v : c.scope())
            for (auto & val : csp.variable(v).current_domain())
                CHECK(c.has_support(csp, v, val));
}

TEST_CASE("Propagator properties")
{
    for (auto method : all_methods()) {
        DYNAMIC_SECTION("Method " << method)
        {
            auto propagate = propagator_for(method);
            CSP csp;
            auto grid = latin_square(csp, 4, false);

            auto initial = propagate(csp, nullopt);
            REQUIRE(initial.consistent);

            auto again = propagate(csp, nullopt);
            CHECK(again.consistent);
            CHECK(again.prunings.empty());

            for (auto & [r, c, val] : vector<tuple<int, int, Value>>{{0, 0, 1_v}, {1, 1, 1_v}, {2, 2, 3_v}}) {
                auto before = domains(csp);
                auto var = grid[r][c];
                csp.variable(var).assign(val);
                auto [consistent, prunings] = propagate(csp, var);

                // no duplicates, and nothing that was already gone
                set<Pruning> distinct(prunings.begin(), prunings.end());
                CHECK(distinct.size() == prunings.size());
                for (auto & [pv, pval] : prunings) {
                    auto & old = before[pv.index];
                    CHECK(old.end() != find(old.begin(), old.end(), pval));
                }

                auto after = domains(csp);
                for (unsigned i = 0; i < after.size(); ++i)
                    CHECK(after[i].size() <= before[i].size());

                REQUIRE(consistent);
            }

            CSP fresh;
            auto fresh_grid = latin_square(fresh, 4, false);
            auto before = domains(fresh);
            fresh.variable(fresh_grid[1][2]).assign(4_v);
            auto result = propagate(fresh, fresh_grid[1][2]);
            restore(fresh, result.prunings);
            fresh.variable(fresh_grid[1][2]).unassign();
            CHECK(domains(fresh) == before);
        }
    }
}

TEST_CASE("Propagation method names")
{
    CHECK(parse_propagation_method("bt") == PropagationMethod::PlainBacktracking);
    CHECK(parse_propagation_method("fc") == PropagationMethod::ForwardChecking);
    CHECK(parse_propagation_method("gac") == PropagationMethod::GeneralisedArcConsistency);
    CHECK(parse_propagation_method("ac3") == nullopt);

    for (auto method : all_methods())
        CHECK(parse_propagation_method(format("{}", method)) == method);
}
