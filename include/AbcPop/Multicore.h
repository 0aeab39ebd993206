#ifndef ABCPOP_MULTICORE_H
#define ABCPOP_MULTICORE_H

#include <optional>
#include <string>

#include <AbcPop/Sampler.h>
#include <AbcPop/Channel.h>

namespace ABCPOP {

    // tokens on the feed channel
    const std::string WORK_TOKEN = "WORK";
    const std::string STOP_TOKEN = "STOP";

    // what a worker needs to know, handed over explicitly at startup
    struct WorkerTask {
        size_t worker_idx;
        unsigned long int seed;      // seeds the worker's private RNG
        SamplerOptions options;
    };

    // Enqueues `n_jobs` work tokens, then `n_procs` stop tokens.
    void feed(const Channel & feed_q, const size_t n_jobs, const size_t n_procs);

    // Worker loop: for every work token, run one n = 1 round of a SingleCoreSampler
    // and post {sample, nr_evaluations} to `result_q`; exit on a stop token.
    // If an evaluation throws, the error is posted in place of a result and the
    // worker exits with a non-zero status.
    //
    // @return the worker's exit status
    int work(const Channel & feed_q, const Channel & result_q, const WorkerTask & task);

// Samples on a fixed pool of worker processes.
//
// Per round, min(n, n_procs) workers are forked along with one feeder process.
// The coordinator then performs exactly n receives from the result channel. Before
// each wait it checks that no worker has died; a dead worker is a WorkerFailure,
// not retried. A started job always runs to completion; there is no cancellation.
class MulticoreSampler : public Sampler {
    public:
        // @param n_procs the size of the worker pool; if 0, the number of available cores
        // @param seed seeds the coordinator RNG, which draws each worker's seed;
        //        if unset, seeded from time and pid
        explicit MulticoreSampler(
            const size_t n_procs = 0,
            const std::optional<unsigned long int> seed = std::nullopt,
            const size_t verbose = 0
        );

        Sample sample_until_n_accepted(const SamplerOptions & options) override;
        std::string name() const override { return "MulticoreSampler"; }

        size_t n_procs() const { return _n_procs; }
        // workers started in the latest round
        size_t last_worker_count() const { return _last_worker_count; }
        // results received in the latest round
        size_t last_receive_count() const { return _last_receive_count; }

        // how long a single wait on the result channel lasts between liveness checks
        void set_liveness_interval(const int ms) { _liveness_ms = ms; }

    private:
        size_t _n_procs;
        RngPtr _rng;
        int _liveness_ms = 100;
        size_t _last_worker_count = 0;
        size_t _last_receive_count = 0;
};

    // number of cores available to this process; at least 1
    size_t nr_cores_available();

}

#endif // ABCPOP_MULTICORE_H
