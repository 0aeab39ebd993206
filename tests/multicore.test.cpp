#include <AbcPop/Multicore.h>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <unistd.h>

#include "testing.h"

using namespace ABCPOP;
using namespace std;

Theta uniform_draw(const gsl_rng * rng) { return { gsl_rng_uniform(rng) }; }

FullInfoParticle accept_all(const Theta & par, const gsl_rng *) {
    return FullInfoParticle(par, true, { { par, 0.0, true } });
}

FullInfoParticle accept_low(const Theta & par, const gsl_rng *) {
    const bool acc = par[0] < 0.5;
    return FullInfoParticle(par, acc, { { par, par[0], acc } });
}

SamplerOptions make_options(const size_t n, const SimulEvalOneFun & fun, const bool record = false) {
    SamplerOptions opts;
    opts.n = n;
    opts.sample_one = uniform_draw;
    opts.simul_eval_one = fun;
    opts.record_rejected_sum_stat = record;
    return opts;
}

void test_feed_order() {
    Channel ch;
    feed(ch, 5, 3);
    vector<string> tokens;
    for (size_t i = 0; i < 8; ++i) { tokens.push_back(ch.get()); }
    IS_TRUE(not ch.poll(0));
    bool order = true;
    for (size_t i = 0; i < 5; ++i) { order = order and tokens[i] == WORK_TOKEN; }
    for (size_t i = 5; i < 8; ++i) { order = order and tokens[i] == STOP_TOKEN; }
    IS_TRUE(order);
}

void test_pool_sizing() {
    MulticoreSampler sampler(3, 42);
    IS_TRUE(sampler.n_procs() == 3);

    Sample s = sampler.sample_until_n_accepted(make_options(5, accept_all));
    IS_TRUE(s.n_accepted() == 5);
    IS_TRUE(sampler.last_worker_count() == 3);
    IS_TRUE(sampler.last_receive_count() == 5);
    IS_TRUE(sampler.nr_evaluations() == 5);

    // never more workers than particles
    Sample one = sampler.sample_until_n_accepted(make_options(1, accept_all));
    IS_TRUE(one.n_accepted() == 1);
    IS_TRUE(sampler.last_worker_count() == 1);

    MulticoreSampler defaulted(0);
    IS_TRUE(defaulted.n_procs() == nr_cores_available());
}

void test_partial_acceptance() {
    MulticoreSampler sampler(4, 7);
    Sample s = sampler.sample_until_n_accepted(make_options(12, accept_low, true));
    IS_TRUE(s.n_accepted() == 12);
    IS_TRUE(sampler.last_receive_count() == 12);
    IS_TRUE(sampler.nr_evaluations() >= 12);
    // every attempt crossed the process boundary along with its particle
    IS_TRUE(s.all_sum_stats().size() == sampler.nr_evaluations());

    // workers draw from their own seeds
    set<double> distinct;
    for (const Particle & p : s.accepted_particles()) {
        IS_TRUE(p.parameter[0] < 0.5);
        distinct.insert(p.parameter[0]);
    }
    IS_TRUE(distinct.size() == 12);
}

void test_non_finite_values() {
    MulticoreSampler sampler(2, 3);
    auto nan_distance = [](const Theta & par, const gsl_rng *) {
        return FullInfoParticle(par, true, { { { numeric_limits<double>::infinity() }, numeric_limits<double>::quiet_NaN(), true } });
    };
    Sample s = sampler.sample_until_n_accepted(make_options(2, nan_distance));
    IS_TRUE(s.n_accepted() == 2);
    IS_TRUE(std::isnan(s.accepted_particles()[0].distance));
    IS_TRUE(std::isinf(s.accepted_particles()[0].sum_stat[0]));
}

void test_evaluation_error() {
    MulticoreSampler sampler(3, 11);
    sampler.set_liveness_interval(10);
    auto failing = [](const Theta &, const gsl_rng *) -> FullInfoParticle {
        throw std::runtime_error("model diverged");
    };
    bool caught = false;
    try {
        sampler.sample_until_n_accepted(make_options(5, failing));
    } catch (const EvaluationError & e) {
        caught = string(e.what()).find("model diverged") != string::npos;
    }
    IS_TRUE(caught);
}

void test_non_standard_exception() {
    const pid_t coordinator = getpid();
    MulticoreSampler sampler(2, 5);
    sampler.set_liveness_interval(10);
    auto throws_int = [](const Theta &, const gsl_rng *) -> FullInfoParticle { throw 42; };
    bool caught = false;
    try {
        sampler.sample_until_n_accepted(make_options(4, throws_int));
    } catch (const EvaluationError & e) {
        caught = string(e.what()).find("unknown exception") != string::npos;
    }
    // a worker that escaped its process would also get here; only the coordinator may
    if (getpid() != coordinator) { _exit(99); }
    IS_TRUE(caught);
}

void test_worker_death() {
    MulticoreSampler sampler(3, 13);
    sampler.set_liveness_interval(10);
    auto dying = [](const Theta &, const gsl_rng *) -> FullInfoParticle { _exit(3); };
    IS_THROWN(sampler.sample_until_n_accepted(make_options(5, dying)), WorkerFailure);

    // the sampler is usable again afterwards
    Sample s = sampler.sample_until_n_accepted(make_options(3, accept_all));
    IS_TRUE(s.n_accepted() == 3);
}

int main() {
    test_feed_order();
    test_pool_sizing();
    test_partial_acceptance();
    test_non_finite_values();
    test_evaluation_error();
    test_non_standard_exception();
    test_worker_death();
    return test_result();
}
