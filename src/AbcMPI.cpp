#include <AbcPop/AbcMPI.h> // pre declarations for MPI functions / types
#include <AbcPop/Codec.h>

#include <climits>
#include <chrono>
#include <iostream>
#include <thread>

#ifdef USING_MPI

namespace ABCPOP {

struct MPITicket {
    int tag;
    std::string payload;
    bool cancelled = false;
    bool done = false;
    std::string reply;
};

class MPIClient::MPIJob : public RemoteJob {
    public:
        MPIJob(MPIClient * client, std::shared_ptr<MPITicket> ticket) : _client(client), _ticket(std::move(ticket)) {}

        bool done() override {
            if (not _ticket->done) { _client->progress(); }
            return _ticket->done;
        }

        BatchResult result() override {
            while (not done()) { std::this_thread::sleep_for(std::chrono::milliseconds(1)); }
            const Json::Value val = decode(_ticket->reply);
            std::string what;
            if (is_error(val, &what)) { throw EvaluationError(what); }
            return batch_result_from_json(val);
        }

        // a pending batch is never sent; a sent one runs, and its reply is dropped
        void cancel() override { _ticket->cancelled = true; }

    private:
        MPIClient * _client;
        std::shared_ptr<MPITicket> _ticket;
};

MPIClient::MPIClient(MPI_par * mp) : _mp(mp) {
    if (_mp->mpi_rank != mpi_root) { throw SamplerError("MPIClient must be constructed on the root rank"); }
    for (int rank = _mp->mpi_size - 1; rank > mpi_root; --rank) { _idle_ranks.push_back(rank); }
}

MPIClient::~MPIClient() {
    try {
        shutdown();
    } catch (const std::exception & e) {
        std::cerr << "ERROR: MPIClient shutdown failed: " << e.what() << std::endl;
    }
}

RemoteJobPtr MPIClient::submit(const BatchTask & task) {
    if (_shut_down) { throw TransportError("MPIClient already shut down"); }
    if (not _registry.contains(task.evaluator)) {
        throw TransportError("no evaluator published as '" + task.evaluator + "'");
    }

    auto ticket = std::make_shared<MPITicket>();
    ticket->payload = encode(to_json(task));
    if (ticket->payload.size() > static_cast<size_t>(INT_MAX)) {
        throw TransportError("batch of " + std::to_string(ticket->payload.size()) + " bytes is too large for an MPI message");
    }
    ticket->tag = _next_tag;
    _next_tag = (_next_tag + 1 < STOP_TAG) ? _next_tag + 1 : 1;

    _pending.push_back(ticket);
    _dispatch();
    return std::make_shared<MPIJob>(this, ticket);
}

RemoteJobPtr MPIClient::submit(BatchClosure /* closure */) {
    throw TransportError("closures cannot be sent to MPI ranks; use the descriptor transport");
}

void MPIClient::progress() {
    int flag = 0;
    MPI_Status status;
    MPI_Iprobe(MPI_ANY_SOURCE, MPI_ANY_TAG, _mp->comm, &flag, &status);
    while (flag) {
        _receive(status);
        MPI_Iprobe(MPI_ANY_SOURCE, MPI_ANY_TAG, _mp->comm, &flag, &status);
    }
    _dispatch();
}

void MPIClient::_receive(const MPI_Status & status) {
    int count = 0;
    MPI_Get_count(&status, MPI_CHAR, &count);
    std::string reply(static_cast<size_t>(count), '\0');
    MPI_Recv(reply.data(),                   // message buffer
             count,                          // message size
             MPI_CHAR,                       // of type char
             status.MPI_SOURCE,              // from the rank that probed
             status.MPI_TAG,                 // the batch's ticket
             _mp->comm,                      // always use this
             MPI_STATUS_IGNORE);

    _idle_ranks.push_back(status.MPI_SOURCE);
    auto it = _in_flight.find(status.MPI_TAG);
    if (it == _in_flight.end()) {
        throw TransportError("reply for unknown batch tag " + std::to_string(status.MPI_TAG));
    }
    if (not it->second->cancelled) {
        it->second->reply = std::move(reply);
        it->second->done = true;
    }
    _in_flight.erase(it);
}

void MPIClient::_dispatch() {
    while (not _pending.empty() and not _idle_ranks.empty()) {
        std::shared_ptr<MPITicket> ticket = _pending.front();
        _pending.pop_front();
        if (ticket->cancelled) { continue; }

        const int rank = _idle_ranks.back();
        _idle_ranks.pop_back();
        MPI_Send(ticket->payload.data(),         // message buffer
                 static_cast<int>(ticket->payload.size()),
                 MPI_CHAR,
                 rank,                           // destination process rank
                 ticket->tag,                    // message tag
                 _mp->comm);
        _in_flight[ticket->tag] = ticket;
    }
}

void MPIClient::shutdown() {
    if (_shut_down) { return; }
    _shut_down = true;
    _pending.clear();

    // receive results for outstanding batches, so no rank is mid-send when stopped
    while (not _in_flight.empty()) {
        MPI_Status status;
        MPI_Probe(MPI_ANY_SOURCE, MPI_ANY_TAG, _mp->comm, &status);
        _receive(status);
    }

    // Tell all the workers they're done for now
    for (int rank = 0; rank < _mp->mpi_size; ++rank) {
        if (rank == mpi_root) { continue; }
        MPI_Send(0, 0, MPI_CHAR, rank, STOP_TAG, _mp->comm);
    }
}

void batch_worker(const EvaluatorRegistry & registry, MPI_par * mp) {
    while (true) {
        MPI_Status status;
        MPI_Probe(mpi_root, MPI_ANY_TAG, mp->comm, &status);
        int count = 0;
        MPI_Get_count(&status, MPI_CHAR, &count);
        std::string payload(static_cast<size_t>(count), '\0');
        MPI_Recv(payload.data(), count, MPI_CHAR, mpi_root, status.MPI_TAG, mp->comm, MPI_STATUS_IGNORE);

        // Check the tag of the received message.
        if (status.MPI_TAG == STOP_TAG) { return; }

        std::string reply;
        try {
            const BatchTask task = batch_task_from_json(decode(payload));
            reply = encode(to_json(evaluate_batch(task, registry)));
        } catch (const std::exception & e) {
            // handed back to the root, which raises it as an EvaluationError
            reply = encode_error(e.what());
        }

        MPI_Send(reply.data(), static_cast<int>(reply.size()), MPI_CHAR, mpi_root, status.MPI_TAG, mp->comm);
    }
}

}

#endif // USING_MPI
