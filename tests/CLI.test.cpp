#include <AbcPop/CLI.h>
#include <AbcPop/Process.h>
#include <cstdio>
#include <fstream>
#include <string>

#include "testing.h"

using namespace ABCPOP;
using namespace std;

// parse_args exits on bad input; run it in a child and report the exit status
int parse_status(const size_t argc, const char * argv[]) {
    Process child([argc, argv]() { parse_args(argc, argv); return 0; }, "parse_args");
    child.start();
    return child.join();
}

void test_parse() {
    const char* hargs[] = {"./CLI.test", "config.json", "-h"};
    cerr << "Should print usage message:" << endl;
    IS_TRUE(parse_args(3, hargs).help);

    const char* vargs[] = {"./CLI.test", "config.json", "-v", "--verbose", "-n", "25", "--seed", "77"};
    const CLIArgs args = parse_args(8, vargs);
    IS_TRUE(args.config_file == "config.json");
    IS_TRUE(args.verbose == 2);
    IS_TRUE(args.num_samples.value() == 25);
    IS_TRUE(args.seed.value() == 77);
    IS_TRUE(not args.help);

    const char* plain[] = {"./CLI.test", "config.json"};
    const CLIArgs defaults = parse_args(2, plain);
    IS_TRUE(not defaults.num_samples.has_value());
    IS_TRUE(not defaults.seed.has_value());
    IS_TRUE(defaults.verbose == 0);
}

void test_parse_errors() {
    cerr << "Should print three usage messages with errors:" << endl;
    const char* missing[] = {"./CLI.test"};
    IS_TRUE(parse_status(1, missing) == 101);
    const char* no_number[] = {"./CLI.test", "config.json", "-n"};
    IS_TRUE(parse_status(3, no_number) == 103);
    const char* bad_number[] = {"./CLI.test", "config.json", "-n", "-4"};
    IS_TRUE(parse_status(4, bad_number) == 103);
    const char* unknown[] = {"./CLI.test", "config.json", "--frobnicate"};
    IS_TRUE(parse_status(3, unknown) == 104);
}

void test_load_and_run() {
    const string path = "CLI.test.config.json";
    {
        ofstream out(path);
        out << "{ \"sampler\": \"single_core\", \"num_samples\": 10, \"seed\": 3, \"verbose\": 1 }";
    }

    const char* argv[] = {"./CLI.test", path.c_str(), "-n", "4", "-v"};
    const SamplerConfig config = load_config(parse_args(5, argv));
    IS_TRUE(config.num_samples == 4);
    IS_TRUE(config.seed.value() == 3);
    IS_TRUE(config.verbose == 2);

    const Sample sample = run(
        config,
        [](const gsl_rng * rng) { return Theta{ gsl_rng_uniform(rng) }; },
        [](const Theta & par, const gsl_rng *) { return FullInfoParticle(par, true, { { par, 0.0, true } }); }
    );
    IS_TRUE(sample.n_accepted() == 4);

    remove(path.c_str());
}

int main() {
    test_parse();
    test_parse_errors();
    test_load_and_run();
    return test_result();
}
