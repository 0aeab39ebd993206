#include <AbcPop/LocalClient.h>
#include <AbcPop/Codec.h>
#include <AbcPop/Multicore.h> // nr_cores_available

#include <atomic>
#include <chrono>
#include <future>

namespace ABCPOP {

class LocalClient::LocalJob : public RemoteJob {
    public:
        explicit LocalJob(BatchClosure run) : _task(std::move(run)), _future(_task.get_future().share()) {}

        bool done() override { return _future.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }
        BatchResult result() override { return _future.get(); }
        void cancel() override { _cancelled = true; }

        // called on a pool thread; failures are stored for result()
        void run() { if (not _cancelled) { _task(); } }

    private:
        std::packaged_task<BatchResult()> _task;
        std::shared_future<BatchResult> _future;
        std::atomic<bool> _cancelled{false};
};

LocalClient::LocalClient(const size_t n_threads) {
    const size_t nthreads = n_threads == 0 ? nr_cores_available() : n_threads;
    _threads.reserve(nthreads);
    for (size_t i = 0; i < nthreads; ++i) { _threads.emplace_back(&LocalClient::_work, this); }
}

LocalClient::~LocalClient() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stop = true;
    }
    _cv.notify_all();
    for (std::thread & t : _threads) { t.join(); }
}

void LocalClient::_work() {
    while (true) {
        std::shared_ptr<LocalJob> job;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _cv.wait(lock, [this] { return _stop or not _queue.empty(); });
            if (_stop) { return; }
            job = _queue.front();
            _queue.pop_front();
        }
        job->run();
    }
}

RemoteJobPtr LocalClient::_enqueue(BatchClosure run) {
    auto job = std::make_shared<LocalJob>(std::move(run));
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _queue.push_back(job);
    }
    _cv.notify_one();
    return job;
}

RemoteJobPtr LocalClient::submit(const BatchTask & task) {
    if (not _registry.contains(task.evaluator)) {
        throw TransportError("no evaluator published as '" + task.evaluator + "'");
    }
    const std::string payload = encode(to_json(task));
    return _enqueue([this, payload]() {
        const BatchTask received = batch_task_from_json(decode(payload));
        const BatchResult result = evaluate_batch(received, _registry);
        return batch_result_from_json(decode(encode(to_json(result))));
    });
}

RemoteJobPtr LocalClient::submit(BatchClosure closure) {
    if (not closure) { throw TransportError("cannot submit an empty closure"); }
    return _enqueue(std::move(closure));
}

}
