#include <AbcPop/Sampler.h>

#include <ctime>
#include <unistd.h>

namespace ABCPOP {

RngPtr make_rng(const unsigned long int seed) {
    RngPtr rng(gsl_rng_alloc(gsl_rng_taus2));
    if (not rng) { throw std::bad_alloc(); }
    gsl_rng_set(rng.get(), seed);
    return rng;
}

unsigned long int default_seed() {
    return static_cast<unsigned long int>(time(NULL)) * static_cast<unsigned long int>(getpid());
}

void SamplerOptions::validate() const {
    if (n == 0) { throw SamplerError("sampler options: n must be positive"); }
    if (not sample_one) { throw SamplerError("sampler options: sample_one is not set"); }
    if (not simul_eval_one) { throw SamplerError("sampler options: simul_eval_one is not set"); }
}

Sampler::RoundGuard::RoundGuard(Sampler & sampler, const SamplerOptions & options) : _sampler(sampler) {
    options.validate();
    if (_sampler._in_round.exchange(true)) {
        throw SamplerError(_sampler.name() + ": a round is already running on this sampler");
    }
    _sampler._nr_evaluations = 0;
}

}
