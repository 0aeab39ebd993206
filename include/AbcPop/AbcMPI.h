#ifndef ABCPOP_MPI_H
#define ABCPOP_MPI_H

#include <AbcPop/Remote.h>

#ifdef USING_MPI

#include <mpi.h>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

// add MPI batch execution to the ABCPOP namespace
namespace ABCPOP {

    // the rank that schedules; every other rank evaluates
    const int mpi_root = 0;

    // the communicator a run uses, and this process's place in it
    struct MPI_par {
        MPI_Comm comm;
        MPI_Info info;
        int mpi_size, mpi_rank;
    };

    // need a positive int that is very unlikely
    // to be reached by the batch tickets in flight
    const int STOP_TAG = 10000000;

    struct MPITicket;

    // A RemoteClient over MPI ranks: lives on `mpi_root`; every other rank runs
    // `batch_worker` and executes one batch at a time. Batches are BatchTask values
    // sent as encoded messages, so only the descriptor transport is available.
    //
    // Evaluators cannot be sent over MPI. Worker ranks must hold a registry with the
    // same names the scheduler publishes; publish() on the root only records the name.
    //
    // On destruction (or shutdown()), waits for busy ranks, discards their results,
    // and sends every worker rank the stop tag.
    class MPIClient : public RemoteClient {
        public:
            explicit MPIClient(MPI_par * mp);
            ~MPIClient();

            MPIClient(const MPIClient &) = delete;
            MPIClient & operator=(const MPIClient &) = delete;

            RemoteJobPtr submit(const BatchTask & task) override;
            // always throws TransportError
            RemoteJobPtr submit(BatchClosure closure) override;
            size_t cores() const override { return static_cast<size_t>(_mp->mpi_size - 1); }

            // receive whatever results have arrived, then hand pending batches to idle ranks
            void progress();
            void shutdown();

        private:
            class MPIJob;
            void _receive(const MPI_Status & status);
            void _dispatch();

            MPI_par * _mp;
            std::deque<std::shared_ptr<MPITicket>> _pending;
            std::map<int, std::shared_ptr<MPITicket>> _in_flight; // by message tag
            std::vector<int> _idle_ranks;
            int _next_tag = 1;
            bool _shut_down = false;
    };

    // The loop run by every rank other than `mpi_root`: receive a batch, evaluate it
    // with `registry`, reply with the result (or the error it raised) under the same
    // tag; return on the stop tag.
    void batch_worker(const EvaluatorRegistry & registry, MPI_par * mp);

}

#endif // USING_MPI

#endif // ABCPOP_MPI_H
