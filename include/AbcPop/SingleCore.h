#ifndef ABCPOP_SINGLECORE_H
#define ABCPOP_SINGLECORE_H

#include <optional>
#include <AbcPop/Sampler.h>

namespace ABCPOP {

// The in-process baseline: draw, evaluate, append, until n are accepted.
// Also the unit of work run by each MulticoreSampler worker.
class SingleCoreSampler : public Sampler {
    public:
        // @param seed seeds this sampler's private RNG; if unset, seeded from time and pid
        explicit SingleCoreSampler(const std::optional<unsigned long int> seed = std::nullopt, const size_t verbose = 0);

        Sample sample_until_n_accepted(const SamplerOptions & options) override;
        std::string name() const override { return "SingleCoreSampler"; }

        const gsl_rng * rng() const { return _rng.get(); }

    private:
        RngPtr _rng;
};

}

#endif // ABCPOP_SINGLECORE_H
