#include <AbcPop/Channel.h>
#include <AbcPop/Errors.h>

#include <cerrno>
#include <cstring>
#include <vector>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

using std::string;

namespace ABCPOP {

// headroom kept below the socket send buffer for per-packet bookkeeping
const size_t SEQPACKET_OVERHEAD = 1024;

// non-exported helper
string errno_message(const string & what) {
    return what + ": " + strerror(errno);
}

Channel::Channel() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) != 0) {
        throw TransportError(errno_message("unable to create channel"));
    }
    _recv_fd = fds[0];
    _send_fd = fds[1];

    int sndbuf = 0;
    socklen_t len = sizeof(sndbuf);
    if (getsockopt(_send_fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, &len) != 0) {
        const string msg = errno_message("unable to query channel buffer size");
        close(_recv_fd);
        close(_send_fd);
        throw TransportError(msg);
    }
    _max_message = static_cast<size_t>(sndbuf) > 2*SEQPACKET_OVERHEAD ? static_cast<size_t>(sndbuf) - SEQPACKET_OVERHEAD : SEQPACKET_OVERHEAD;
}

Channel::~Channel() {
    close(_recv_fd);
    close(_send_fd);
}

void Channel::put(const string & msg) const {
    if (msg.size() > _max_message) {
        throw TransportError("message of " + std::to_string(msg.size()) + " bytes exceeds the channel limit of "
            + std::to_string(_max_message) + " bytes");
    }
    while (true) {
        const ssize_t sent = send(_send_fd, msg.data(), msg.size(), MSG_NOSIGNAL);
        if (sent == static_cast<ssize_t>(msg.size())) { return; }
        if (sent < 0 and errno == EINTR) { continue; }
        if (sent < 0) { throw TransportError(errno_message("unable to send on channel")); }
        throw TransportError("short send on channel");
    }
}

string Channel::get() const {
    std::vector<char> buffer(_max_message + SEQPACKET_OVERHEAD);
    while (true) {
        struct iovec iov = { buffer.data(), buffer.size() };
        struct msghdr hdr;
        memset(&hdr, 0, sizeof(hdr));
        hdr.msg_iov = &iov;
        hdr.msg_iovlen = 1;

        const ssize_t got = recvmsg(_recv_fd, &hdr, 0);
        if (got < 0 and errno == EINTR) { continue; }
        if (got < 0) { throw TransportError(errno_message("unable to receive on channel")); }
        if (hdr.msg_flags & MSG_TRUNC) { throw TransportError("truncated message on channel"); }
        return string(buffer.data(), static_cast<size_t>(got));
    }
}

bool Channel::poll(const int timeout_ms) const {
    struct pollfd pfd = { _recv_fd, POLLIN, 0 };
    while (true) {
        const int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 and errno == EINTR) { continue; }
        if (ready < 0) { throw TransportError(errno_message("unable to poll channel")); }
        return ready > 0 and (pfd.revents & POLLIN);
    }
}

}
