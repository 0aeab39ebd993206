#ifndef ABCPOP_PROCESS_H
#define ABCPOP_PROCESS_H

#include <functional>
#include <string>
#include <sys/types.h>

namespace ABCPOP {

// A forked unit of execution. `target` runs in the child; its return value is
// the child's exit status. An exception escaping `target` is reported on stderr
// and the child exits with status 1. The child never returns into the caller's code.
//
// A Process that is still running when destroyed is killed and reaped.
class Process {
    public:
        explicit Process(std::function<int()> target, const std::string & label = "process");
        ~Process();

        Process(const Process &) = delete;
        Process & operator=(const Process &) = delete;
        Process(Process && other) noexcept;

        // throws WorkerFailure if the fork fails
        void start();

        // non-blocking; reaps the child if it has exited
        bool is_alive();
        // blocks until the child exits; returns its exit code, or 128 + signal number
        int join();
        // SIGKILL, then reap
        void kill();

        bool started() const { return _pid > 0; }
        bool exited() const { return _reaped; }
        // exited with status 0
        bool exited_cleanly() const { return _reaped and _exit_code == 0; }
        int exit_code() const { return _exit_code; }
        pid_t pid() const { return _pid; }
        const std::string & label() const { return _label; }

    private:
        void _record(const int status);

        std::function<int()> _target;
        std::string _label;
        pid_t _pid = -1;
        bool _reaped = false;
        int _exit_code = -1;
};

}

#endif // ABCPOP_PROCESS_H
