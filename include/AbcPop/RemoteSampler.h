#ifndef ABCPOP_REMOTESAMPLER_H
#define ABCPOP_REMOTESAMPLER_H

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <AbcPop/Sampler.h>
#include <AbcPop/Remote.h>

namespace ABCPOP {

// Reassembles results that complete in any order into strict job id order.
//
// Results are buffered in `unprocessed` by job id; drain() moves them into
// `consumed` for as long as the smallest buffered id is the one right after the
// last consumed id. Consumption therefore stalls at the first gap.
class SequentialBuffer {
    public:
        // @param first_id the first job id that will be issued
        explicit SequentialBuffer(const size_t first_id = 1) : _next_valid_index(first_id - 1) {}

        // buffer a finished result; counts towards accepted_total() whatever its position
        void add(EvaluatedJob && job);

        // sequential consumption; returns the number of results consumed by this call
        size_t drain();

        // accepted results seen in any order (admission control only)
        size_t accepted_total() const { return _accepted_total; }
        // accepted results consumed in order
        size_t accepted_sequential() const { return _accepted_sequential; }
        // the last job id consumed in order
        size_t next_valid_index() const { return _next_valid_index; }

        const std::map<size_t, EvaluatedJob> & unprocessed() const { return _unprocessed; }
        const std::map<size_t, EvaluatedJob> & consumed() const { return _consumed; }

    private:
        std::map<size_t, EvaluatedJob> _unprocessed;
        std::map<size_t, EvaluatedJob> _consumed;
        size_t _accepted_total = 0;
        size_t _accepted_sequential = 0;
        size_t _next_valid_index;
};

enum TRANSPORT { DESCRIPTOR, CLOSURE };

// Adaptive batched job-queue scheduler over a RemoteClient.
//
// Each iteration of the polling loop:
//  1. collects finished batches into the SequentialBuffer
//  2. consumes buffered results in strict job id order
//  3. stops once n accepted results have been consumed in order
//  4. otherwise, while fewer than min(client_max_jobs, client cores) batches are in flight
//     and fewer than n accepted results have been seen in any order, tops the in-flight
//     batches back up, each with `batch_size` freshly drawn parameters under new job ids
//
// On exit every batch still in flight is cancelled, and results beyond the
// cutoff are discarded. The population is then assembled in job id order, and
// nr_evaluations() is the job id of the last result it used.
class RemoteBatchSampler : public Sampler {
    public:
        // @param client the remote-execution capability; shared with the caller
        // @param batch_size parameter draws per submitted batch
        // @param client_max_jobs ceiling on batches in flight
        // @param transport DESCRIPTOR sends BatchTask values naming a published evaluator;
        //        CLOSURE sends closures capturing the evaluator
        // @param seed seeds the draws and the per-batch seeds; if unset, from time and pid
        RemoteBatchSampler(
            std::shared_ptr<RemoteClient> client,
            const size_t batch_size = 1,
            const size_t client_max_jobs = 200,
            const TRANSPORT transport = DESCRIPTOR,
            const std::optional<unsigned long int> seed = std::nullopt,
            const size_t verbose = 0
        );

        Sample sample_until_n_accepted(const SamplerOptions & options) override;
        std::string name() const override { return "RemoteBatchSampler"; }

        // the evaluator name used by the DESCRIPTOR transport. Defaults to a name unique
        // to this instance, so samplers sharing a client never overwrite each other's
        // evaluator; set a fixed name where workers register evaluators themselves (MPI)
        void set_evaluator_name(const std::string & evaluator) { _evaluator = evaluator; }
        const std::string & evaluator_name() const { return _evaluator; }
        void set_poll_interval(const std::chrono::milliseconds interval) { _poll_interval = interval; }

        size_t batch_size() const { return _batch_size; }
        size_t client_max_jobs() const { return _client_max_jobs; }
        TRANSPORT transport() const { return _transport; }

        // parameter draws submitted in the latest round
        size_t last_submitted_evaluations() const { return _last_submitted_evaluations; }
        size_t last_submitted_batches() const { return _last_submitted_batches; }

    private:
        RemoteJobPtr _submit_batch(const SamplerOptions & options, size_t & next_job_id);

        std::shared_ptr<RemoteClient> _client;
        size_t _batch_size;
        size_t _client_max_jobs;
        TRANSPORT _transport;
        RngPtr _rng;
        std::string _evaluator;
        std::chrono::milliseconds _poll_interval{1};
        size_t _last_submitted_evaluations = 0;
        size_t _last_submitted_batches = 0;
};

}

#endif // ABCPOP_REMOTESAMPLER_H
