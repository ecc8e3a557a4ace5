#include <fdp/constraints/cage.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <catch2/catch_test_macros.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <functional>
#include <limits>
#include <set>
#include <vector>

using namespace fdp;

using std::function;
using std::next_permutation;
using std::numeric_limits;
using std::set;
using std::size_t;
using std::sort;
using std::vector;

using fmt::format;

namespace
{
    // left to right evaluation of one particular ordering, as a fraction for division
    auto ordering_gives(const vector<Value> & values, CageOperation op, Value target) -> bool
    {
        auto num = values.front().raw_value;
        long long den = 1;
        for (size_t i = 1; i < values.size(); ++i) {
            auto v = values[i].raw_value;
            switch (op) {
            case CageOperation::Add: num += v; break;
            case CageOperation::Subtract: num -= v; break;
            case CageOperation::Multiply: num *= v; break;
            case CageOperation::Divide: den *= v; break;
            }
        }
        return den != 0 && num == target.raw_value * den;
    }

    auto brute_force(const CSP & csp, const vector<VariableID> & vars, CageOperation op, Value target) -> set<Tuple>
    {
        set<Tuple> result;
        Tuple current;
        function<auto(size_t)->void> extend = [&](size_t pos) {
            if (pos == vars.size()) {
                auto ordering = current;
                sort(ordering.begin(), ordering.end());
                do {
                    if (ordering_gives(ordering, op, target)) {
                        result.insert(current);
                        break;
                    }
                } while (next_permutation(ordering.begin(), ordering.end()));
                return;
            }

            for (auto & v : csp.variable(vars[pos]).original_domain()) {
                current.push_back(v);
                extend(pos + 1);
                current.pop_back();
            }
        };
        extend(0);
        return result;
    }
}

TEST_CASE("Cage operations")
{
    CHECK(cage_holds({1_v, 2_v, 3_v}, CageOperation::Add, 6_v));
    CHECK(! cage_holds({1_v, 2_v, 3_v}, CageOperation::Add, 5_v));
    CHECK(cage_holds({2_v, 3_v, 4_v}, CageOperation::Multiply, 24_v));
    CHECK(cage_holds({1_v, 4_v}, CageOperation::Subtract, 3_v));
    CHECK(cage_holds({4_v, 1_v}, CageOperation::Subtract, 3_v));
    CHECK(cage_holds({1_v, 2_v, 6_v}, CageOperation::Subtract, 3_v));
    CHECK(! cage_holds({1_v, 4_v}, CageOperation::Subtract, 2_v));
    CHECK(cage_holds({2_v, 6_v}, CageOperation::Divide, 3_v));
    CHECK(cage_holds({2_v, 12_v, 3_v}, CageOperation::Divide, 2_v));
    CHECK(! cage_holds({2_v, 5_v}, CageOperation::Divide, 2_v));
    CHECK(! cage_holds({0_v, 0_v}, CageOperation::Divide, 1_v));
    CHECK(cage_holds({0_v, 3_v}, CageOperation::Divide, 0_v));

    CHECK(cage_operation_from_code(0) == CageOperation::Add);
    CHECK(cage_operation_from_code(1) == CageOperation::Subtract);
    CHECK(cage_operation_from_code(2) == CageOperation::Divide);
    CHECK(cage_operation_from_code(3) == CageOperation::Multiply);
    CHECK(! cage_operation_from_code(4));
    CHECK(format("{}", CageOperation::Divide) == "/");
}

TEST_CASE("Cage tables match brute force")
{
    struct Case
    {
        vector<vector<Value>> domains;
        CageOperation op;
        Value target;
    };

    for (auto & [domains, op, target] : vector<Case>{
             {{{1_v, 2_v, 3_v, 4_v}, {1_v, 2_v, 3_v, 4_v}}, CageOperation::Add, 5_v},
             {{{1_v, 2_v, 3_v, 4_v}, {1_v, 2_v, 3_v, 4_v}, {1_v, 2_v, 3_v, 4_v}}, CageOperation::Add, 7_v},
             {{{1_v, 2_v, 3_v, 4_v, 5_v}, {1_v, 2_v, 3_v, 4_v, 5_v}}, CageOperation::Subtract, 2_v},
             {{{1_v, 2_v, 3_v, 4_v, 5_v, 6_v}, {1_v, 2_v, 3_v}, {1_v, 2_v, 3_v, 4_v, 5_v, 6_v}}, CageOperation::Subtract, 1_v},
             {{{1_v, 2_v, 3_v, 4_v, 5_v, 6_v}, {1_v, 2_v, 3_v, 4_v, 5_v, 6_v}}, CageOperation::Divide, 2_v},
             {{{1_v, 2_v, 4_v, 8_v}, {1_v, 2_v}, {2_v, 4_v, 8_v}}, CageOperation::Divide, 2_v},
             {{{0_v, 1_v, 2_v}, {0_v, 1_v, 2_v}}, CageOperation::Divide, 0_v},
             {{{1_v, 2_v, 3_v, 4_v}, {1_v, 2_v, 3_v, 4_v}, {2_v, 3_v}}, CageOperation::Multiply, 12_v},
             {{{1_v, 2_v, 3_v}}, CageOperation::Add, 2_v}}) {
        DYNAMIC_SECTION(op << " " << target << " over " << domains.size() << " cells")
        {
            CSP csp;
            vector<VariableID> vars;
            for (auto & d : domains)
                vars.push_back(csp.create_variable(format("v{}", vars.size()), d));

            auto con = cage(csp, vars, op, target, "cage");
            set<Tuple> built(con.satisfying_tuples().begin(), con.satisfying_tuples().end());
            CHECK(built.size() == con.satisfying_tuples().size());
            CHECK(built == brute_force(csp, vars, op, target));
            csp.add_constraint(con);
        }
    }
}

TEST_CASE("Single cell cages fix the cell")
{
    CSP csp;
    auto v = csp.create_variable("v", 1_v, 4_v);
    auto con = cage(csp, {v}, CageOperation::Add, 3_v, "fixed");
    CHECK(con.satisfying_tuples() == vector<Tuple>{{3_v}});
}

TEST_CASE("Cage arithmetic on large values")
{
    auto big = Value{numeric_limits<long long>::max() / 2 + 1};

    CHECK_THROWS_AS(cage_holds({big, big}, CageOperation::Add, 1_v), ModelException);
    CHECK_THROWS_AS(cage_holds({big, 4_v}, CageOperation::Multiply, 1_v), ModelException);
    CHECK_THROWS_AS(cage_holds({big, 1_v}, CageOperation::Subtract, 1_v), ModelException);

    // target * divisor is too big to be any value, so this simply fails
    CHECK(! cage_holds({6_v, 3_v}, CageOperation::Divide, big));
    CHECK(cage_holds({Value{numeric_limits<long long>::max() - 1}, 2_v}, CageOperation::Divide, big - 1_v));

    CSP csp;
    auto x = csp.create_variable("x", vector{1_v, big});
    auto y = csp.create_variable("y", vector{1_v, big});
    CHECK_THROWS_AS(cage(csp, {x, y}, CageOperation::Multiply, 2_v, "too big"), ModelException);
}
