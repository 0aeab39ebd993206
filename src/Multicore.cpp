#include <AbcPop/Multicore.h>
#include <AbcPop/Process.h>
#include <AbcPop/SingleCore.h>
#include <AbcPop/Codec.h>
#include <AbcPop/AbcLog.h>

#include <algorithm>
#include <iostream>
#include <vector>
#include <unistd.h>

using std::string;
using std::vector;

namespace ABCPOP {

size_t nr_cores_available() {
    const long ncores = sysconf(_SC_NPROCESSORS_ONLN);
    return ncores > 0 ? static_cast<size_t>(ncores) : 1;
}

void feed(const Channel & feed_q, const size_t n_jobs, const size_t n_procs) {
    for (size_t i = 0; i < n_jobs; ++i) { feed_q.put(WORK_TOKEN); }
    for (size_t i = 0; i < n_procs; ++i) { feed_q.put(STOP_TOKEN); }
}

int work(const Channel & feed_q, const Channel & result_q, const WorkerTask & task) {
    SingleCoreSampler single_core_sampler(task.seed);
    const SamplerOptions worker_options = task.options.with_n(1);

    while (true) {
        const string token = feed_q.get();
        if (token == STOP_TOKEN) { break; }
        if (token != WORK_TOKEN) { throw TransportError("worker " + std::to_string(task.worker_idx) + " got unknown token: " + token); }

        try {
            const Sample res = single_core_sampler.sample_until_n_accepted(worker_options);
            Json::Value val;
            val["sample"] = to_json(res);
            val["nr_evaluations"] = static_cast<Json::UInt64>(single_core_sampler.nr_evaluations());
            result_q.put(encode(val));
        } catch (const std::exception & e) {
            // the coordinator re-raises this; the worker is done either way
            result_q.put(encode_error(e.what()));
            return 1;
        } catch (...) {
            result_q.put(encode_error("unknown exception"));
            return 1;
        }
    }
    return 0;
}

// non-exported helper: the next result, as long as the pool is healthy
string get_if_workers_healthy(
    const Channel & result_q, vector<Process> & workers, Process & feeder, const int liveness_ms
) {
    while (true) {
        if (result_q.poll(0)) { return result_q.get(); }

        size_t running = 0;
        for (Process & worker : workers) {
            if (worker.is_alive()) { ++running; continue; }
            if (not worker.exited_cleanly()) {
                // it may have reported its own failure on the way out
                if (result_q.poll(0)) { return result_q.get(); }
                throw WorkerFailure(worker.label() + " (pid " + std::to_string(worker.pid())
                    + ") exited unexpectedly with status " + std::to_string(worker.exit_code()));
            }
        }
        if (not feeder.is_alive() and not feeder.exited_cleanly()) {
            throw WorkerFailure("feeder exited unexpectedly with status " + std::to_string(feeder.exit_code()));
        }
        if (running == 0 and not result_q.poll(0)) {
            throw WorkerFailure("all workers exited with results outstanding");
        }

        if (result_q.poll(liveness_ms)) { return result_q.get(); }
    }
}

MulticoreSampler::MulticoreSampler(
    const size_t n_procs, const std::optional<unsigned long int> seed, const size_t verbose
) : Sampler(verbose),
    _n_procs(n_procs == 0 ? nr_cores_available() : n_procs),
    _rng(make_rng(seed.value_or(default_seed()))) {}

Sample MulticoreSampler::sample_until_n_accepted(const SamplerOptions & options) {
    RoundGuard guard(*this, options);

    // starting more than n workers does not help in this scheme
    const size_t n_procs = std::min(options.n, _n_procs);
    if (_verbose > 0) { AbcLog::round_start(name(), options.n, n_procs, _n_procs); }

    Channel feed_q;
    Channel result_q;

    vector<Process> workers;
    workers.reserve(n_procs);
    for (size_t i = 0; i < n_procs; ++i) {
        const WorkerTask task = { i, gsl_rng_get(_rng.get()), options };
        workers.emplace_back(
            [&feed_q, &result_q, task]() { return work(feed_q, result_q, task); },
            "worker " + std::to_string(i)
        );
    }
    for (Process & worker : workers) { worker.start(); }
    _last_worker_count = workers.size();
    _last_receive_count = 0;

    const size_t n_jobs = options.n;
    Process feeder([&feed_q, n_jobs, n_procs]() { feed(feed_q, n_jobs, n_procs); return 0; }, "feeder");
    feeder.start();

    Sample sample = _create_empty_sample(options);
    size_t nr_evaluations = 0;

    for (size_t i = 0; i < options.n; ++i) {
        const Json::Value val = decode(get_if_workers_healthy(result_q, workers, feeder, _liveness_ms));
        ++_last_receive_count;

        string what;
        if (is_error(val, &what)) { throw EvaluationError(what); }
        if (not val.isMember("nr_evaluations") or not val["nr_evaluations"].isUInt64()) {
            throw TransportError("malformed worker result: missing evaluation count");
        }
        sample += sample_from_json(val["sample"]);
        nr_evaluations += static_cast<size_t>(val["nr_evaluations"].asUInt64());
        if (_verbose > 1) { std::cerr << "    received result " << i + 1 << " of " << options.n << std::endl; }
    }

    feeder.join();
    for (Process & worker : workers) {
        const int status = worker.join();
        if (status != 0) {
            std::cerr << "WARNING: " << worker.label() << " exited with status " << status << " after all results arrived." << std::endl;
        }
    }

    _nr_evaluations = nr_evaluations;
    if (_verbose > 0) { AbcLog::round_end(name(), sample.n_accepted(), _nr_evaluations); }
    return sample;
}

}
