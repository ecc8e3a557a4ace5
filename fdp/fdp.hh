#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_FDP_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_FDP_HH 1

#include <fdp/constraint.hh>
#include <fdp/csp.hh>
#include <fdp/exception.hh>
#include <fdp/propagators.hh>
#include <fdp/search_heuristics.hh>
#include <fdp/solve.hh>
#include <fdp/stats.hh>
#include <fdp/value.hh>
#include <fdp/variable.hh>
#include <fdp/variable_id.hh>

#include <fdp/constraints/all_different.hh>
#include <fdp/constraints/cage.hh>
#include <fdp/constraints/not_equals.hh>
#include <fdp/constraints/tabulate.hh>

#include <fdp/models/funpuzz.hh>

#endif
