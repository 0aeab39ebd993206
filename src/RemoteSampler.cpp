#include <AbcPop/RemoteSampler.h>
#include <AbcPop/AbcLog.h>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <list>
#include <thread>

namespace ABCPOP {

void SequentialBuffer::add(EvaluatedJob && job) {
    if (job.job_id <= _next_valid_index or _unprocessed.count(job.job_id) == 1) {
        throw TransportError("duplicate result for job id " + std::to_string(job.job_id));
    }
    if (job.accepted != job.particle.accepted) {
        throw TransportError("inconsistent acceptance flags for job id " + std::to_string(job.job_id));
    }
    if (job.accepted) { ++_accepted_total; }
    const size_t job_id = job.job_id;
    _unprocessed.emplace(job_id, std::move(job));
}

size_t SequentialBuffer::drain() {
    size_t nconsumed = 0;
    while (not _unprocessed.empty() and _unprocessed.begin()->first == _next_valid_index + 1) {
        auto node = _unprocessed.extract(_unprocessed.begin());
        if (node.mapped().accepted) { ++_accepted_sequential; }
        ++_next_valid_index;
        _consumed.insert(std::move(node));
        ++nconsumed;
    }
    return nconsumed;
}

// cancels whatever is still in flight when a round ends, normally or not
// numbers the default evaluator names of all RemoteBatchSampler instances
std::atomic<size_t> evaluator_counter{0};

struct CancelInFlight {
    std::list<RemoteJobPtr> & running;
    ~CancelInFlight() { for (RemoteJobPtr & job : running) { job->cancel(); } }
};

RemoteBatchSampler::RemoteBatchSampler(
    std::shared_ptr<RemoteClient> client,
    const size_t batch_size,
    const size_t client_max_jobs,
    const TRANSPORT transport,
    const std::optional<unsigned long int> seed,
    const size_t verbose
) : Sampler(verbose), _client(std::move(client)), _batch_size(batch_size), _client_max_jobs(client_max_jobs),
    _transport(transport), _rng(make_rng(seed.value_or(default_seed()))),
    _evaluator("simul_eval_one/" + std::to_string(evaluator_counter++)) {
    if (not _client) { throw SamplerError("RemoteBatchSampler requires a client"); }
    if (_batch_size == 0) { throw SamplerError("RemoteBatchSampler: batch_size must be positive"); }
    if (_client_max_jobs == 0) { throw SamplerError("RemoteBatchSampler: client_max_jobs must be positive"); }
}

RemoteJobPtr RemoteBatchSampler::_submit_batch(const SamplerOptions & options, size_t & next_job_id) {
    BatchTask task;
    task.evaluator = _evaluator;
    task.seed = gsl_rng_get(_rng.get());
    task.pars.reserve(_batch_size);
    task.job_ids.reserve(_batch_size);
    for (size_t i = 0; i < _batch_size; ++i) {
        task.pars.push_back(options.sample_one(_rng.get()));
        task.job_ids.push_back(next_job_id++);
    }

    _last_submitted_evaluations += _batch_size;
    ++_last_submitted_batches;
    if (_verbose > 1) {
        std::cerr << "    submitting jobs " << task.job_ids.front() << " to " << task.job_ids.back() << std::endl;
    }

    if (_transport == DESCRIPTOR) { return _client->submit(task); }

    const SimulEvalOneFun simul_eval_one = options.simul_eval_one;
    return _client->submit(BatchClosure([task, simul_eval_one]() { return evaluate_batch(task, simul_eval_one); }));
}

Sample RemoteBatchSampler::sample_until_n_accepted(const SamplerOptions & options) {
    RoundGuard guard(*this, options);

    if (_client->cores() == 0) { throw SamplerError(name() + ": client reports no cores"); }
    if (_transport == DESCRIPTOR) { _client->publish(_evaluator, options.simul_eval_one); }
    if (_verbose > 0) { AbcLog::round_start(name(), options.n, std::min(_client_max_jobs, _client->cores()), _client_max_jobs); }

    _last_submitted_evaluations = 0;
    _last_submitted_batches = 0;

    SequentialBuffer buffer(1);
    size_t next_job_id = 1;
    std::list<RemoteJobPtr> running;
    CancelInFlight cancel_guard{running};

    while (true) {
        bool progressed = false;

        for (auto it = running.begin(); it != running.end();) {
            if ((*it)->done()) {
                BatchResult batch = (*it)->result();
                it = running.erase(it);
                for (EvaluatedJob & job : batch) { buffer.add(std::move(job)); }
                progressed = true;
            } else {
                ++it;
            }
        }

        buffer.drain();

        if (buffer.accepted_sequential() >= options.n) { break; }

        // the accepted_total guard keeps from over-submitting once enough accepted
        // results exist anywhere in the pipeline, consumed in order or not
        const size_t capacity = std::min(_client_max_jobs, _client->cores());
        if ((running.size() < capacity) and (buffer.accepted_total() < options.n)) {
            while (running.size() < capacity) {
                running.push_back(_submit_batch(options, next_job_id));
            }
            progressed = true;
        }

        if (not progressed) { std::this_thread::sleep_for(_poll_interval); }
    }

    const size_t ncancelled = running.size();
    for (RemoteJobPtr & job : running) { job->cancel(); }
    running.clear();

    Sample sample = _create_empty_sample(options);
    size_t counter_accepted = 0;
    size_t ndrained = 0;
    for (auto it = buffer.consumed().begin(); counter_accepted < options.n; ++it) {
        const EvaluatedJob & job = it->second;
        sample.append(job.particle);
        if (job.particle.accepted) { ++counter_accepted; }
        _nr_evaluations = job.job_id;
        ++ndrained;
    }

    if (_verbose > 1) {
        std::cerr << "    cancelled " << ncancelled << " batches; discarded "
                  << (buffer.consumed().size() - ndrained) + buffer.unprocessed().size() << " results" << std::endl;
    }
    if (_verbose > 0) { AbcLog::round_end(name(), sample.n_accepted(), _nr_evaluations); }
    return sample;
}

}
