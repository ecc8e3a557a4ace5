#include <fdp/stats.hh>

#include <ostream>

using namespace fdp;

using std::ostream;

auto fdp::operator<<(ostream & o, const Stats & s) -> ostream &
{
    o << "recursions: " << s.recursions << '\n';
    o << "failures: " << s.failures << '\n';
    o << "propagations: " << s.propagations << '\n';
    o << "prunings: " << s.prunings << '\n';
    o << "max depth: " << s.max_depth << '\n';
    o << "solutions: " << s.solutions << '\n';
    o << "solve time: " << (s.solve_time.count() / 1'000'000.0) << "s" << '\n';
    return o;
}
