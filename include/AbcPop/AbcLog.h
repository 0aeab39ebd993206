#ifndef ABCPOP_LOG_H
#define ABCPOP_LOG_H

#include <iostream>
#include <string>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Particle.h>

namespace ABCPOP {

// Round reporting for the samplers. Everything goes to std::cerr by default,
// gated by the sampler's verbose level at the call site.
struct AbcLog {

    // @param n_procs the number of parallel units actually used this round
    // @param n_requested the configured number, if different; 0 to omit
    static void round_start(
        const std::string & sampler, const size_t n,
        const size_t n_procs, const size_t n_requested = 0,
        std::ostream & os = std::cerr
    );

    static void round_end(
        const std::string & sampler,
        const size_t n_accepted, const size_t nr_evaluations,
        std::ostream & os = std::cerr
    );

    // acceptance rate plus per-column means and medians of the accepted parameters
    static void population_report(
        const Population & pop, const size_t nr_evaluations,
        std::ostream & os = std::cerr
    );

    static float_type median(const Col & data);

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        AbcLog() {};

};

} // namespace ABCPOP

#endif // ABCPOP_LOG_H
