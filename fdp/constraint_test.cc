#include <fdp/constraint.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

using namespace fdp;

using std::move;
using std::vector;

TEST_CASE("Constraint tuples")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    auto y = csp.create_variable("y", 1_v, 3_v);

    Constraint less{"x < y", {x, y}};
    less.add_satisfying_tuples(vector<FixedTuple<2>>{{1_v, 2_v}, {1_v, 3_v}, {2_v, 3_v}, {1_v, 2_v}});

    CHECK(less.name() == "x < y");
    CHECK(less.arity() == 2);
    CHECK(less.involves(x));
    CHECK(less.involves(y));
    CHECK(less.satisfying_tuples().size() == 3);

    CHECK(less.check({1_v, 3_v}));
    CHECK(! less.check({3_v, 1_v}));
    CHECK(! less.check({2_v, 2_v}));

    CHECK_THROWS_AS(less.add_satisfying_tuple({1_v}), ModelException);
    CHECK_THROWS_AS(less.add_satisfying_tuples(vector<FixedTuple<3>>{{1_v, 2_v, 3_v}}), ModelException);
}

TEST_CASE("Constraint supports and assignment queries")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    auto y = csp.create_variable("y", 1_v, 3_v);
    auto z = csp.create_variable("z", 1_v, 3_v);

    Constraint less{"x < y", {x, y}};
    less.add_satisfying_tuples(vector<Tuple>{{1_v, 2_v}, {1_v, 3_v}, {2_v, 3_v}});

    CHECK(less.count_unassigned(csp) == 2);
    CHECK(less.has_support(csp, x, 1_v));
    CHECK(less.has_support(csp, x, 2_v));
    CHECK(! less.has_support(csp, x, 3_v));
    CHECK(! less.has_support(csp, y, 1_v));

    csp.variable(y).prune_value(3_v);
    CHECK(! less.has_support(csp, x, 2_v));
    CHECK(less.has_support(csp, x, 1_v));

    csp.variable(x).assign(1_v);
    CHECK(less.count_unassigned(csp) == 1);
    CHECK(less.unassigned_variables(csp) == vector{y});
    CHECK(less.has_support(csp, y, 2_v));

    CHECK_THROWS_AS(less.has_support(csp, z, 1_v), UnexpectedException);
}

TEST_CASE("Constraint rejects repeated scope variables")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    CHECK_THROWS_AS((Constraint{"bad", {x, x}}), ModelException);
}

TEST_CASE("Constraint keeps one copy of each tuple")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    auto y = csp.create_variable("y", 1_v, 3_v);

    Constraint diagonal{"x = y", {x, y}};
    for (int repeat = 0; repeat < 3; ++repeat)
        diagonal.add_satisfying_tuples(vector<Tuple>{{1_v, 1_v}, {2_v, 2_v}, {3_v, 3_v}});
    CHECK(diagonal.satisfying_tuples() == vector<Tuple>{{1_v, 1_v}, {2_v, 2_v}, {3_v, 3_v}});

    auto id = csp.add_constraint(move(diagonal));
    auto & stored = csp.constraint(id);
    CHECK(stored.satisfying_tuples().size() == 3);
    CHECK(stored.check({2_v, 2_v}));
    CHECK(! stored.check({2_v, 3_v}));
    CHECK(! stored.check({2_v}));
    CHECK(stored.has_support(csp, y, 3_v));
}
