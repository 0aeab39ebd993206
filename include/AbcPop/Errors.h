#ifndef ABCPOP_ERRORS_H
#define ABCPOP_ERRORS_H

#include <stdexcept>
#include <string>

namespace ABCPOP {

// Base for everything the sampling engine reports. Nothing below is ever retried.
struct SamplerError : public std::runtime_error {
    explicit SamplerError(const std::string & msg) : std::runtime_error(msg) {}
};

// an evaluation raised on the far side of a process / rank boundary;
// in-process evaluations propagate their own exception type instead
struct EvaluationError : public SamplerError {
    explicit EvaluationError(const std::string & msg) : SamplerError("evaluation failed: " + msg) {}
};

// a pool worker (or the feeder) terminated with results still outstanding
struct WorkerFailure : public SamplerError {
    explicit WorkerFailure(const std::string & msg) : SamplerError(msg) {}
};

// a task, its arguments or its result could not be carried across a boundary
struct TransportError : public SamplerError {
    explicit TransportError(const std::string & msg) : SamplerError(msg) {}
};

struct ConfigError : public SamplerError {
    explicit ConfigError(const std::string & msg) : SamplerError(msg) {}
};

}

#endif // ABCPOP_ERRORS_H
