#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CSP_FWD_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_CSP_FWD_HH 1

namespace fdp
{
    class CSP;
}

#endif
