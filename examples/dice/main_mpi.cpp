#include <iostream>
#include <memory>

#include <AbcPop/AbcMPI.h>
#include <AbcPop/CLI.h>
#include <AbcPop/Errors.h>
#include <AbcPop/RemoteSampler.h>

#include "dice.h"

using namespace ABCPOP;

void setup_mpi(MPI_par &m, int &argc, char **argv) {
    /* MPI variables */
    m.comm  = MPI_COMM_WORLD;
    m.info  = MPI_INFO_NULL;

    /* Initialize MPI */
    MPI_Init(&argc, &argv);
    MPI_Comm_size(m.comm, &m.mpi_size);
    MPI_Comm_rank(m.comm, &m.mpi_rank);
}

// the name the scheduler and the worker ranks both use for the dice evaluator
const std::string DICE_EVALUATOR = "dice";

// rank 0 schedules batches; every other rank evaluates them
int run_ranks(MPI_par & mp, const CLIArgs & args) {
    const SamplerConfig config = load_config(args);
    const DiceModel model = DiceModel::from_json(JsonConfig(args.config_file).root());
    const SimulEvalOneFun evaluate = [model](const Theta & par, const gsl_rng * rng) { return model.evaluate(par, rng); };

    if (mp.mpi_rank != mpi_root) {
        EvaluatorRegistry registry;
        registry.publish(DICE_EVALUATOR, evaluate);
        batch_worker(registry, &mp);
        return 0;
    }

    if (config.transport != DESCRIPTOR) { throw ConfigError("MPI runs only support the descriptor transport"); }
    if (mp.mpi_size < 2) { throw ConfigError("MPI runs need at least 2 ranks"); }

    auto client = std::make_shared<MPIClient>(&mp);
    SamplerConfig remote = config;
    remote.sampler = REMOTE;
    remote.evaluator = DICE_EVALUATOR;
    const Sample sample = run(remote, [model](const gsl_rng * rng) { return model.sample_prior(rng); }, evaluate, client);
    client->shutdown();

    const Population pop = sample.get_accepted_population();
    for (size_t i = 0; i < pop.size(); ++i) {
        std::cout << pop[i].parameter[0] << " " << pop[i].parameter[1] << " " << pop[i].distance << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    MPI_par mp;
    setup_mpi(mp, argc, argv);

    const CLIArgs args = parse_args(argc, const_cast<const char **>(argv));
    int status = 0;
    if (not args.help) {
        try {
            status = run_ranks(mp, args);
        } catch (const ConfigError & e) {
            std::cerr << "ERROR (rank " << mp.mpi_rank << "): " << e.what() << std::endl;
            status = 1;
        } catch (const SamplerError & e) {
            std::cerr << "ERROR (rank " << mp.mpi_rank << "): " << e.what() << std::endl;
            status = 2;
        } catch (const std::exception & e) {
            std::cerr << "ERROR (rank " << mp.mpi_rank << "): model failed: " << e.what() << std::endl;
            status = 3;
        }
    }

    if (status != 0) { MPI_Abort(mp.comm, status); }
    MPI_Finalize();
    return status;
}
