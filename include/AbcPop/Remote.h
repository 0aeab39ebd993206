#ifndef ABCPOP_REMOTE_H
#define ABCPOP_REMOTE_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <AbcPop/Sampler.h>

// The remote-execution capability consumed by RemoteBatchSampler. A client runs
// batches of evaluations somewhere else (threads, MPI ranks, ...) and hands back
// a pollable handle per batch.

namespace ABCPOP {

// one evaluated parameter point, tagged with the job id it was issued under
struct EvaluatedJob {
    size_t job_id;
    bool accepted;
    FullInfoParticle particle;
};

typedef std::vector<EvaluatedJob> BatchResult;

// A value-only description of a batch: everything a remote worker needs, and
// nothing captured from the submitting scope. The evaluation function itself is
// referred to by the name it was published under.
struct BatchTask {
    std::string evaluator;
    unsigned long int seed;        // seeds the worker-side RNG for this batch
    std::vector<Theta> pars;
    std::vector<size_t> job_ids;   // job_ids[i] is the id of pars[i]
};

// The permissive transport: a closure carrying its evaluation function along.
// Only clients sharing the submitter's address space can run these.
typedef std::function<BatchResult()> BatchClosure;

// handle to a submitted batch
class RemoteJob {
    public:
        virtual ~RemoteJob() = default;
        // non-blocking
        virtual bool done() = 0;
        // only valid once done(); rethrows a failure of the batch
        virtual BatchResult result() = 0;
        // best effort: a batch that has not started will not run; a running one may complete
        virtual void cancel() = 0;
};

typedef std::shared_ptr<RemoteJob> RemoteJobPtr;

// name => evaluation function, for the descriptor transport
class EvaluatorRegistry {
    public:
        void publish(const std::string & name, const SimulEvalOneFun & fun);
        // throws TransportError if nothing is published under `name`
        SimulEvalOneFun lookup(const std::string & name) const;
        bool contains(const std::string & name) const;

    private:
        mutable std::mutex _mutex;
        std::map<std::string, SimulEvalOneFun> _evaluators;
};

class RemoteClient {
    public:
        virtual ~RemoteClient() = default;

        // descriptor transport; throws TransportError if the task cannot be sent
        virtual RemoteJobPtr submit(const BatchTask & task) = 0;
        // closure transport; throws TransportError where closures cannot be carried
        virtual RemoteJobPtr submit(BatchClosure closure) = 0;
        // the number of batches the client can run at once
        virtual size_t cores() const = 0;

        // make `fun` available to descriptor tasks naming `name`
        virtual void publish(const std::string & name, const SimulEvalOneFun & fun) { _registry.publish(name, fun); }
        const EvaluatorRegistry & registry() const { return _registry; }

    protected:
        EvaluatorRegistry _registry;
};

// Runs a batch on the worker side: seeds a private RNG from the task, then
// evaluates the parameters in order. Evaluation errors propagate.
BatchResult evaluate_batch(const BatchTask & task, const SimulEvalOneFun & simul_eval_one);

// looks up the task's evaluator in `registry`, then as above
BatchResult evaluate_batch(const BatchTask & task, const EvaluatorRegistry & registry);

}

#endif // ABCPOP_REMOTE_H
