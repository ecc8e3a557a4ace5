#include <fdp/constraints/not_equals.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace fdp;

using std::vector;

TEST_CASE("CSP variables")
{
    CSP csp{"test"};
    CHECK(csp.name() == "test");

    auto x = csp.create_variable("x", 1_v, 4_v);
    auto y = csp.create_variable("y", vector{5_v, 7_v});

    CHECK(csp.all_variables() == vector{x, y});
    CHECK(csp.variable(x).name() == "x");
    CHECK(csp.variable(x).original_domain() == vector{1_v, 2_v, 3_v, 4_v});
    CHECK(csp.variable(y).original_domain() == vector{5_v, 7_v});

    CHECK_THROWS_AS(csp.create_variable("x", 1_v, 2_v), ModelException);
}

TEST_CASE("CSP constraints")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    auto y = csp.create_variable("y", 1_v, 3_v);
    auto z = csp.create_variable("z", 1_v, 3_v);

    auto xy = csp.add_constraint(not_equals(csp, x, y, "x != y"));
    auto yz = csp.add_constraint(not_equals(csp, y, z, "y != z"));

    CHECK(csp.all_constraints().size() == 2);
    CHECK(csp.constraint(xy).name() == "x != y");
    CHECK(csp.constraints_containing(x) == vector{xy});
    CHECK(csp.constraints_containing(y) == vector{xy, yz});
    CHECK(csp.constraints_containing(z) == vector{yz});

    SECTION("Tuple values must be in the original domains")
    {
        Constraint bad{"bad", {x, y}};
        bad.add_satisfying_tuple({1_v, 4_v});
        CHECK_THROWS_AS(csp.add_constraint(bad), ModelException);
        CHECK(csp.all_constraints().size() == 2);
    }

    SECTION("Scope variables must belong to the CSP")
    {
        Constraint bad{"bad", {x, VariableID{17}}};
        CHECK_THROWS_AS(csp.add_constraint(bad), ModelException);
    }
}

TEST_CASE("CSP reset")
{
    CSP csp;
    auto x = csp.create_variable("x", 1_v, 3_v);
    auto y = csp.create_variable("y", 1_v, 3_v);

    csp.variable(x).prune_value(2_v);
    csp.variable(y).assign(3_v);
    CHECK(csp.unassigned_variables() == vector{x});

    csp.reset();
    CHECK(csp.unassigned_variables() == vector{x, y});
    CHECK(csp.variable(x).current_domain_size() == 3);
    CHECK(csp.variable(y).current_domain_size() == 3);
}
