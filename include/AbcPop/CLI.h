#ifndef ABCPOP_CLI_H
#define ABCPOP_CLI_H

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <AbcPop/Config.h>
#include <AbcPop/Sample.h>
#include <AbcPop/Sampler.h>

namespace ABCPOP {

// A "usage" function for the sampling driver executables
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var num_samples overrides `num_samples` from the configuration file
// @var seed overrides `seed` from the configuration file
// @var verbose the verbosity level; added to the configured level
// @var help whether -h was passed; nothing else is parsed
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;
    std::optional<size_t> num_samples;
    std::optional<unsigned long int> seed;
    size_t verbose = 0;
    bool help = false;
};

// parses the args passed to a typical main() function for a sampling program
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
CLIArgs parse_args(const size_t argc, const char * argv[]);

// reads the configuration named by `args`, then applies the command line overrides
SamplerConfig load_config(const CLIArgs & args);

// Builds the configured sampler and runs one round with the given model functions,
// reporting the round and the resulting population when verbose.
//
// @param client passed on to make_sampler
Sample run(
    const SamplerConfig & config,
    const SampleOneFun & sample_one,
    const SimulEvalOneFun & simul_eval_one,
    std::shared_ptr<RemoteClient> client = nullptr
);

}

#endif // ABCPOP_CLI_H
