#include <AbcPop/Remote.h>

namespace ABCPOP {

void EvaluatorRegistry::publish(const std::string & name, const SimulEvalOneFun & fun) {
    if (not fun) { throw TransportError("cannot publish an empty evaluator as '" + name + "'"); }
    std::lock_guard<std::mutex> lock(_mutex);
    _evaluators[name] = fun;
}

SimulEvalOneFun EvaluatorRegistry::lookup(const std::string & name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _evaluators.find(name);
    if (it == _evaluators.end()) { throw TransportError("no evaluator published as '" + name + "'"); }
    return it->second;
}

bool EvaluatorRegistry::contains(const std::string & name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _evaluators.count(name) == 1;
}

BatchResult evaluate_batch(const BatchTask & task, const SimulEvalOneFun & simul_eval_one) {
    if (task.pars.size() != task.job_ids.size()) {
        throw TransportError("malformed batch: " + std::to_string(task.pars.size()) + " parameter sets for "
            + std::to_string(task.job_ids.size()) + " job ids");
    }
    RngPtr rng = make_rng(task.seed);

    BatchResult results;
    results.reserve(task.pars.size());
    for (size_t i = 0; i < task.pars.size(); ++i) {
        FullInfoParticle particle = simul_eval_one(task.pars[i], rng.get());
        const bool accepted = particle.accepted;
        results.push_back({ task.job_ids[i], accepted, std::move(particle) });
    }
    return results;
}

BatchResult evaluate_batch(const BatchTask & task, const EvaluatorRegistry & registry) {
    return evaluate_batch(task, registry.lookup(task.evaluator));
}

}
