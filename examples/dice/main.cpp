#include <iostream>

#include <AbcPop/CLI.h>
#include <AbcPop/Errors.h>

#include "dice.h"

using namespace ABCPOP;

int main(int argc, const char * argv[]) {
    const CLIArgs args = parse_args(argc, argv);
    if (args.help) { return 0; }

    try {
        const SamplerConfig config = load_config(args);
        const DiceModel model = DiceModel::from_json(JsonConfig(args.config_file).root());

        const Sample sample = run(
            config,
            [model](const gsl_rng * rng) { return model.sample_prior(rng); },
            [model](const Theta & par, const gsl_rng * rng) { return model.evaluate(par, rng); }
        );

        const Population pop = sample.get_accepted_population();
        for (size_t i = 0; i < pop.size(); ++i) {
            const Particle & p = pop[i];
            std::cout << p.parameter[0] << " " << p.parameter[1] << " " << p.distance << std::endl;
        }
    } catch (const ConfigError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const SamplerError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception & e) {
        // raised by the model itself, in process
        std::cerr << "ERROR: model failed: " << e.what() << std::endl;
        return 3;
    }

    return 0;
}
