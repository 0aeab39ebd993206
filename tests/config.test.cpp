#include <AbcPop/Config.h>
#include <AbcPop/LocalClient.h>
#include <AbcPop/Multicore.h>
#include <stdexcept>

#include "testing.h"

using namespace ABCPOP;
using namespace std;

void test_defaults() {
    const SamplerConfig config = JsonConfig::from_string("{ \"num_samples\": 10 }").parse();
    IS_TRUE(config.sampler == SINGLE_CORE);
    IS_TRUE(config.num_samples == 10);
    IS_TRUE(config.n_procs == 0);
    IS_TRUE(config.batch_size == 1);
    IS_TRUE(config.client_max_jobs == 200);
    IS_TRUE(config.transport == DESCRIPTOR);
    IS_TRUE(not config.record_rejected_sum_stats);
    IS_TRUE(not config.seed.has_value());
    IS_TRUE(config.poll_interval_ms == 1);
    IS_TRUE(config.evaluator.empty());
    IS_TRUE(config.verbose == 0);
}

void test_full() {
    const SamplerConfig config = JsonConfig::from_string(R"({
        "sampler": "remote",
        "num_samples": 50,
        "batch_size": 4,
        "client_max_jobs": 8,
        "client_cores": 2,
        "transport": "closure",
        "evaluator": "dice",
        "record_rejected_sum_stats": true,
        "seed": 12345,
        "poll_interval_ms": 0,
        "verbose": 2
    })").parse();
    IS_TRUE(config.sampler == REMOTE);
    IS_TRUE(config.num_samples == 50);
    IS_TRUE(config.batch_size == 4);
    IS_TRUE(config.client_max_jobs == 8);
    IS_TRUE(config.client_cores == 2);
    IS_TRUE(config.transport == CLOSURE);
    IS_TRUE(config.evaluator == "dice");
    IS_TRUE(config.record_rejected_sum_stats);
    IS_TRUE(config.seed.value() == 12345);
    IS_TRUE(config.poll_interval_ms == 0);
    IS_TRUE(config.verbose == 2);
}

void test_invalid() {
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": "), ConfigError);
    IS_THROWN(JsonConfig::from_string("[1, 2]"), ConfigError);
    IS_THROWN(JsonConfig("no_such_config_file.json"), ConfigError);

    IS_THROWN(JsonConfig::from_string("{}").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 0 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": -3 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 2.5 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"sampler\": \"gpu\" }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"batch_size\": 0 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"client_max_jobs\": 0 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"transport\": \"pickle\" }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"record_rejected_sum_stats\": \"yes\" }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"sampler\": 3 }").parse(), ConfigError);
    IS_THROWN(JsonConfig::from_string("{ \"num_samples\": 5, \"evaluator\": 7 }").parse(), ConfigError);
}

void test_make_sampler() {
    SamplerConfig config;
    config.num_samples = 4;
    config.seed = 8;

    config.sampler = SINGLE_CORE;
    IS_TRUE(make_sampler(config)->name() == "SingleCoreSampler");

    config.sampler = MULTICORE;
    config.n_procs = 3;
    auto multicore = make_sampler(config);
    IS_TRUE(multicore->name() == "MulticoreSampler");
    IS_TRUE(dynamic_cast<MulticoreSampler &>(*multicore).n_procs() == 3);

    config.sampler = REMOTE;
    config.batch_size = 3;
    config.client_max_jobs = 7;
    config.transport = CLOSURE;
    auto remote = make_sampler(config, make_shared<LocalClient>(2));
    IS_TRUE(remote->name() == "RemoteBatchSampler");
    const RemoteBatchSampler & rs = dynamic_cast<RemoteBatchSampler &>(*remote);
    IS_TRUE(rs.batch_size() == 3);
    IS_TRUE(rs.client_max_jobs() == 7);
    IS_TRUE(rs.transport() == CLOSURE);
    IS_TRUE(rs.evaluator_name() != "dice");

    config.evaluator = "dice";
    auto named = make_sampler(config, make_shared<LocalClient>(2));
    IS_TRUE(dynamic_cast<RemoteBatchSampler &>(*named).evaluator_name() == "dice");
    config.evaluator.clear();

    // without a client, a local one is built
    config.client_cores = 2;
    auto local = make_sampler(config);
    SamplerOptions opts;
    opts.n = 4;
    opts.sample_one = [](const gsl_rng * rng) { return Theta{ gsl_rng_uniform(rng) }; };
    opts.simul_eval_one = [](const Theta & par, const gsl_rng *) { return FullInfoParticle(par, true, { { par, 0.0, true } }); };
    IS_TRUE(local->sample_until_n_accepted(opts).n_accepted() == 4);
    IS_TRUE(local->nr_evaluations() == 4);
}

int main() {
    test_defaults();
    test_full();
    test_invalid();
    test_make_sampler();
    return test_result();
}
