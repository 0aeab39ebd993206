#include <AbcPop/Config.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

#include <AbcPop/LocalClient.h>
#include <AbcPop/Multicore.h>
#include <AbcPop/SingleCore.h>

using std::string;

namespace ABCPOP {

std::ostream& operator<<(std::ostream &os, const SAMPLER &sampler) {
    switch (sampler) {
        case SINGLE_CORE: os << "single_core"; break;
        case MULTICORE: os << "multicore"; break;
        case REMOTE: os << "remote"; break;
        default: os << "UNDEFINED ABCPOP::SAMPLER";
    }
    return os;
}

// non-exported helpers for reading checked values
Json::Value parse_json(const string & json_text, const string & source) {
    Json::Value root;
    Json::Reader reader;
    if (not reader.parse(json_text, root)) {
        throw ConfigError("failed to parse configuration " + source + ":\n" + reader.getFormattedErrorMessages());
    }
    if (not root.isObject()) { throw ConfigError("configuration " + source + " is not a JSON object"); }
    return root;
}

size_t get_size(const Json::Value & root, const char * key, const size_t fallback) {
    if (not root.isMember(key)) { return fallback; }
    const Json::Value & val = root[key];
    if (not val.isUInt64()) { throw ConfigError(string("`") + key + "` must be a non-negative integer"); }
    return val.asUInt64();
}

bool get_bool(const Json::Value & root, const char * key, const bool fallback) {
    if (not root.isMember(key)) { return fallback; }
    const Json::Value & val = root[key];
    if (not val.isBool()) { throw ConfigError(string("`") + key + "` must be true or false"); }
    return val.asBool();
}

string get_string(const Json::Value & root, const char * key, const string & fallback) {
    if (not root.isMember(key)) { return fallback; }
    const Json::Value & val = root[key];
    if (not val.isString()) { throw ConfigError(string("`") + key + "` must be a string"); }
    return val.asString();
}

JsonConfig::JsonConfig(const string & filename) {
    std::ifstream in(filename);
    if (not in) { throw ConfigError("file does not exist: " + filename); }
    std::stringstream buffer;
    buffer << in.rdbuf();
    _root = parse_json(buffer.str(), filename);
}

JsonConfig JsonConfig::from_string(const string & json_text) {
    JsonConfig config;
    config._root = parse_json(json_text, "string");
    return config;
}

SamplerConfig JsonConfig::parse() const {
    SamplerConfig config;

    const string sampler = get_string(_root, "sampler", "single_core");
    if (sampler == "single_core") {
        config.sampler = SINGLE_CORE;
    } else if (sampler == "multicore") {
        config.sampler = MULTICORE;
    } else if (sampler == "remote") {
        config.sampler = REMOTE;
    } else {
        throw ConfigError("unknown `sampler`: " + sampler + " (expected single_core, multicore, or remote)");
    }

    if (not _root.isMember("num_samples")) { throw ConfigError("`num_samples` must be specified"); }
    config.num_samples = get_size(_root, "num_samples", 0);
    if (config.num_samples == 0) { throw ConfigError("`num_samples` must be positive"); }

    config.n_procs = get_size(_root, "n_procs", config.n_procs);

    config.batch_size = get_size(_root, "batch_size", config.batch_size);
    if (config.batch_size == 0) { throw ConfigError("`batch_size` must be positive"); }

    config.client_max_jobs = get_size(_root, "client_max_jobs", config.client_max_jobs);
    if (config.client_max_jobs == 0) { throw ConfigError("`client_max_jobs` must be positive"); }

    config.client_cores = get_size(_root, "client_cores", config.client_cores);

    const string transport = get_string(_root, "transport", "descriptor");
    if (transport == "descriptor") {
        config.transport = DESCRIPTOR;
    } else if (transport == "closure") {
        config.transport = CLOSURE;
    } else {
        throw ConfigError("unknown `transport`: " + transport + " (expected descriptor or closure)");
    }

    config.evaluator = get_string(_root, "evaluator", config.evaluator);

    config.record_rejected_sum_stats = get_bool(_root, "record_rejected_sum_stats", config.record_rejected_sum_stats);

    if (_root.isMember("seed")) { config.seed.emplace(get_size(_root, "seed", 0)); }

    config.poll_interval_ms = get_size(_root, "poll_interval_ms", config.poll_interval_ms);
    config.verbose = get_size(_root, "verbose", config.verbose);

    if (config.sampler != REMOTE and config.verbose > 0) {
        for (auto key : { "batch_size", "client_max_jobs", "client_cores", "transport", "evaluator", "poll_interval_ms" }) {
            if (_root.isMember(key)) { std::cerr << "WARNING: ignoring `" << key << "` for sampler " << config.sampler << std::endl; }
        }
    }

    return config;
}

std::unique_ptr<Sampler> make_sampler(
    const SamplerConfig & config,
    std::shared_ptr<RemoteClient> client
) {
    switch (config.sampler) {
        case SINGLE_CORE:
            return std::make_unique<SingleCoreSampler>(config.seed, config.verbose);
        case MULTICORE:
            return std::make_unique<MulticoreSampler>(config.n_procs, config.seed, config.verbose);
        case REMOTE: {
            if (not client) { client = std::make_shared<LocalClient>(config.client_cores); }
            auto sampler = std::make_unique<RemoteBatchSampler>(
                client, config.batch_size, config.client_max_jobs, config.transport, config.seed, config.verbose
            );
            sampler->set_poll_interval(std::chrono::milliseconds(config.poll_interval_ms));
            if (not config.evaluator.empty()) { sampler->set_evaluator_name(config.evaluator); }
            return sampler;
        }
        default:
            throw ConfigError("unhandled sampler type");
    }
}

}
