#ifndef ABCPOP_LOCALCLIENT_H
#define ABCPOP_LOCALCLIENT_H

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <AbcPop/Remote.h>

namespace ABCPOP {

// A RemoteClient whose "remote" side is a pool of threads in this process.
//
// Both transports are supported. Descriptor tasks are encoded at submission and
// decoded on the pool thread, and their results make the same trip back, so
// anything the codec cannot carry fails here as it would across a real boundary.
// Batches run in submission order; a cancelled batch that has not started never runs.
class LocalClient : public RemoteClient {
    public:
        // @param n_threads pool size; if 0, the number of available cores
        explicit LocalClient(const size_t n_threads = 0);
        ~LocalClient();

        LocalClient(const LocalClient &) = delete;
        LocalClient & operator=(const LocalClient &) = delete;

        RemoteJobPtr submit(const BatchTask & task) override;
        RemoteJobPtr submit(BatchClosure closure) override;
        size_t cores() const override { return _threads.size(); }

    private:
        class LocalJob;
        RemoteJobPtr _enqueue(BatchClosure run);
        void _work();

        std::vector<std::thread> _threads;
        std::deque<std::shared_ptr<LocalJob>> _queue;
        std::mutex _mutex;
        std::condition_variable _cv;
        bool _stop = false;
};

}

#endif // ABCPOP_LOCALCLIENT_H
