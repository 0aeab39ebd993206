#ifndef ABCPOP_SAMPLER_H
#define ABCPOP_SAMPLER_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <gsl/gsl_rng.h>

#include <AbcPop/Errors.h>
#include <AbcPop/Particle.h>
#include <AbcPop/Sample.h>

namespace ABCPOP {

// draws one candidate parameter point; must be safe to call repeatedly, and from
// independent processes each holding its own RNG
typedef std::function<Theta(const gsl_rng*)> SampleOneFun;

// simulates + applies the acceptance test to one parameter point; should not depend on
// any state other than its arguments (and what it captured by value)
typedef std::function<FullInfoParticle(const Theta &, const gsl_rng*)> SimulEvalOneFun;

struct GslRngDeleter {
    void operator()(gsl_rng * rng) const { gsl_rng_free(rng); }
};
typedef std::unique_ptr<gsl_rng, GslRngDeleter> RngPtr;

// a gsl_rng_taus2 generator seeded with `seed`
RngPtr make_rng(const unsigned long int seed);

// sys time and the process id; distinct across forked processes
unsigned long int default_seed();

// Configuration of one sampling round. Created fresh by the caller for every round.
struct SamplerOptions {
    size_t n = 0;                           // target number of accepted particles
    SampleOneFun sample_one;
    SimulEvalOneFun simul_eval_one;
    bool record_rejected_sum_stat = false;

    // throws SamplerError unless n > 0 and both functions are set
    void validate() const;

    // the same options, with a different target size
    SamplerOptions with_n(const size_t new_n) const {
        SamplerOptions opts(*this);
        opts.n = new_n;
        return opts;
    }
};

// A `Sampler` produces a population of exactly `n` accepted particles.
//
// Variants: SingleCoreSampler, MulticoreSampler, RemoteBatchSampler.
//
// An instance can be reused across rounds, and keeps the evaluation count of the
// latest round. Only one round may run on an instance at a time: the round owns
// `_nr_evaluations` while it runs, and a concurrent second call throws SamplerError.
class Sampler {
    public:
        explicit Sampler(const size_t verbose = 0) : _verbose(verbose) {}
        virtual ~Sampler() = default;

        Sampler(const Sampler &) = delete;
        Sampler & operator=(const Sampler &) = delete;

        // Runs a round until `options.n` particles are accepted.
        //
        // @return a sample holding exactly `options.n` accepted particles
        //
        // There is no time bound: if the acceptance probability is zero, this does not return.
        // If an evaluation throws, the round aborts without a result; nothing is retried.
        virtual Sample sample_until_n_accepted(const SamplerOptions & options) = 0;

        virtual std::string name() const = 0;

        // evaluation index of the last particle consumed in the latest round
        size_t nr_evaluations() const { return _nr_evaluations; }

        size_t verbose() const { return _verbose; }
        void set_verbose(const size_t verbose) { _verbose = verbose; }

    protected:
        // marks a round as running on this instance; validates the options
        // and resets the evaluation count
        class RoundGuard {
            public:
                RoundGuard(Sampler & sampler, const SamplerOptions & options);
                ~RoundGuard() { _sampler._in_round = false; }
                RoundGuard(const RoundGuard &) = delete;
                RoundGuard & operator=(const RoundGuard &) = delete;
            private:
                Sampler & _sampler;
        };

        Sample _create_empty_sample(const SamplerOptions & options) const {
            return SampleFactory(options.record_rejected_sum_stat)();
        }

        size_t _nr_evaluations = 0;
        size_t _verbose;

    private:
        std::atomic<bool> _in_round{false};
};

}

#endif // ABCPOP_SAMPLER_H
