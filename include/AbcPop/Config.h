#ifndef ABCPOP_CONFIG_H
#define ABCPOP_CONFIG_H

#include <memory>
#include <optional>
#include <string>
#include <json/json.h>

#include <AbcPop/Errors.h>
#include <AbcPop/Remote.h>
#include <AbcPop/RemoteSampler.h>
#include <AbcPop/Sampler.h>

namespace ABCPOP {

enum SAMPLER { SINGLE_CORE, MULTICORE, REMOTE };

std::ostream& operator<<(std::ostream &os, const SAMPLER &sampler);

// Everything needed to build a sampler and run a round, as read from a configuration file.
// Unset keys keep these defaults.
struct SamplerConfig {
    SAMPLER sampler = SINGLE_CORE;
    size_t num_samples = 0;                 // required; the population size n
    size_t n_procs = 0;                     // MULTICORE: pool size; 0 => available cores
    size_t batch_size = 1;                  // REMOTE
    size_t client_max_jobs = 200;           // REMOTE
    size_t client_cores = 0;                // REMOTE, built-in local client threads; 0 => available cores
    TRANSPORT transport = DESCRIPTOR;       // REMOTE
    std::string evaluator;                  // REMOTE, DESCRIPTOR: published name; empty => unique per sampler
    bool record_rejected_sum_stats = false;
    std::optional<unsigned long int> seed;  // unset => time and pid
    size_t poll_interval_ms = 1;            // REMOTE
    size_t verbose = 0;
};

struct Config {
    virtual ~Config() = default;
    // @throws ConfigError on a missing or invalid value
    virtual SamplerConfig parse() const = 0;
};

struct JsonConfig : public Config {
    // @throws ConfigError if the file is missing or is not valid JSON
    explicit JsonConfig(const std::string & filename);

    // the same, from JSON text instead of a file
    static JsonConfig from_string(const std::string & json_text);

    SamplerConfig parse() const override;

    const Json::Value & root() const { return _root; }

    private:
        JsonConfig() = default;
        Json::Value _root;
};

// Builds the backend named by `config.sampler`.
//
// @param client for REMOTE only; if null, a LocalClient with `config.client_cores` threads
std::unique_ptr<Sampler> make_sampler(
    const SamplerConfig & config,
    std::shared_ptr<RemoteClient> client = nullptr
);

}

#endif // ABCPOP_CONFIG_H
