#include <AbcPop/Process.h>
#include <AbcPop/Errors.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

namespace ABCPOP {

Process::Process(std::function<int()> target, const std::string & label) : _target(std::move(target)), _label(label) {}

Process::Process(Process && other) noexcept :
    _target(std::move(other._target)), _label(std::move(other._label)),
    _pid(other._pid), _reaped(other._reaped), _exit_code(other._exit_code) {
    other._pid = -1;
}

Process::~Process() {
    if (started() and not _reaped) { kill(); }
}

void Process::start() {
    if (started()) { throw WorkerFailure(_label + " already started"); }
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = fork();
    if (pid < 0) { throw WorkerFailure(_label + ": fork failed: " + strerror(errno)); }

    if (pid == 0) { // child
        int status = 1;
        try {
            status = _target();
        } catch (const std::exception & e) {
            std::cerr << "ERROR: " << _label << " (pid " << getpid() << ") failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "ERROR: " << _label << " (pid " << getpid() << ") failed with a non-standard exception" << std::endl;
        }
        std::cout.flush();
        std::cerr.flush();
        _exit(status);
    }

    _pid = pid;
}

void Process::_record(const int status) {
    _reaped = true;
    if (WIFEXITED(status)) {
        _exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        _exit_code = 128 + WTERMSIG(status);
    }
}

bool Process::is_alive() {
    if (not started() or _reaped) { return false; }
    int status = 0;
    pid_t res;
    do { res = waitpid(_pid, &status, WNOHANG); } while (res < 0 and errno == EINTR);
    if (res == 0) { return true; }
    if (res < 0) { throw WorkerFailure(_label + ": waitpid failed: " + strerror(errno)); }
    _record(status);
    return false;
}

int Process::join() {
    if (not started()) { throw WorkerFailure(_label + " joined before it was started"); }
    if (_reaped) { return _exit_code; }
    int status = 0;
    pid_t res;
    do { res = waitpid(_pid, &status, 0); } while (res < 0 and errno == EINTR);
    if (res < 0) { throw WorkerFailure(_label + ": waitpid failed: " + strerror(errno)); }
    _record(status);
    return _exit_code;
}

void Process::kill() {
    if (not started() or _reaped) { return; }
    ::kill(_pid, SIGKILL);
    int status = 0;
    pid_t res;
    do { res = waitpid(_pid, &status, 0); } while (res < 0 and errno == EINTR);
    if (res == _pid) { _record(status); } else { _reaped = true; }
}

}
