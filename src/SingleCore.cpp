#include <AbcPop/SingleCore.h>
#include <AbcPop/AbcLog.h>

namespace ABCPOP {

SingleCoreSampler::SingleCoreSampler(
    const std::optional<unsigned long int> seed, const size_t verbose
) : Sampler(verbose), _rng(make_rng(seed.value_or(default_seed()))) {}

Sample SingleCoreSampler::sample_until_n_accepted(const SamplerOptions & options) {
    RoundGuard guard(*this, options);
    if (_verbose > 0) { AbcLog::round_start(name(), options.n, 1); }

    Sample sample = _create_empty_sample(options);
    size_t nr_evaluations = 0;

    while (sample.n_accepted() < options.n) {
        const Theta par = options.sample_one(_rng.get());
        const FullInfoParticle particle = options.simul_eval_one(par, _rng.get());
        ++nr_evaluations;
        sample.append(particle);
    }

    _nr_evaluations = nr_evaluations;
    if (_verbose > 0) { AbcLog::round_end(name(), sample.n_accepted(), _nr_evaluations); }
    return sample;
}

}
