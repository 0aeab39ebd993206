#include <AbcPop/CLI.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include <AbcPop/AbcLog.h>

using std::cerr;
using std::endl;
using std::string;

namespace ABCPOP {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Options:" << endl;
    cerr << ident << "-n 1234      : number of particles to accept; overrides `num_samples` in config.json." << endl;
    cerr << ident << "--seed 1234  : seed for the sampler; overrides `seed` in config.json." << endl;
    cerr << ident << "-(-v)erbose  : when working, be effusive; repeat for more detail." << endl;
    cerr << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    cerr << endl;
    cerr << "Configuration keys (config.json):" << endl;
    cerr << ident << "sampler                   : single_core (default), multicore, or remote" << endl;
    cerr << ident << "num_samples               : number of particles to accept (required)" << endl;
    cerr << ident << "n_procs                   : multicore pool size; 0 => available cores" << endl;
    cerr << ident << "batch_size, client_max_jobs, client_cores, transport, evaluator, poll_interval_ms : remote scheduling" << endl;
    cerr << ident << "record_rejected_sum_stats : keep summary statistics of rejected attempts" << endl;
    cerr << ident << "seed, verbose" << endl;
    cerr << endl;
    cerr << "Example use:" << endl;
    cerr << "$ " << cmd << " config.json -n 100 -v" << endl;
    if (status != 0) { exit(status); }
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the positive integer following flag `i`, or a usage exit
unsigned long int positive_arg(const string & cmd, const size_t argc, const char * argv[], const size_t i) {
    const string err = string("Error: ") + argv[i] + " must be followed by a positive integer.";
    // this will occur if the flag is the last argument, i.e. no number provided after
    if (i == (argc - 1)) { usage(cmd, err, 103); }
    char * end = nullptr;
    const char * txt = argv[i + 1];
    const unsigned long int val = strtoul(txt, &end, 10);
    // this will occur if provided a negative number or a non-integer
    if (txt[0] == '-' or end == txt or *end != '\0' or val < 1) { usage(cmd, err, 103); }
    return val;
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    const string cmd = argc > 0 ? string(argv[0]) : "abcpop";

    // check for help requested
    if (std::any_of(argv, argv + argc, [](const char * arg) { return argcheck(arg, "-h", "--help"); })) {
        usage(cmd);
        CLIArgs args("");
        args.help = true;
        return args;
    }

    if (argc < 2) { usage(cmd, "Error: a configuration file is required.", 101); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {
        if (strcmp(argv[i], "-n") == 0) {
            args.num_samples.emplace(positive_arg(cmd, argc, argv, i));
            ++i;
        } else if (strcmp(argv[i], "--seed") == 0) {
            args.seed.emplace(positive_arg(cmd, argc, argv, i));
            ++i;
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    return args;
}

SamplerConfig load_config(const CLIArgs & args) {
    SamplerConfig config = JsonConfig(args.config_file).parse();
    if (args.num_samples) { config.num_samples = args.num_samples.value(); }
    if (args.seed) { config.seed = args.seed; }
    config.verbose += args.verbose;
    return config;
}

Sample run(
    const SamplerConfig & config,
    const SampleOneFun & sample_one,
    const SimulEvalOneFun & simul_eval_one,
    std::shared_ptr<RemoteClient> client
) {
    auto sampler = make_sampler(config, client);

    SamplerOptions options;
    options.n = config.num_samples;
    options.sample_one = sample_one;
    options.simul_eval_one = simul_eval_one;
    options.record_rejected_sum_stat = config.record_rejected_sum_stats;

    if (config.verbose > 0) { cerr << "Running " << sampler->name() << " as configured: " << config.sampler << endl; }

    Sample sample = sampler->sample_until_n_accepted(options);

    if (config.verbose > 0) { AbcLog::population_report(sample.get_accepted_population(), sampler->nr_evaluations()); }

    return sample;
}

}
