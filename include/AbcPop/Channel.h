#ifndef ABCPOP_CHANNEL_H
#define ABCPOP_CHANNEL_H

#include <string>

namespace ABCPOP {

// An ordered, message-oriented FIFO between processes, built on an AF_UNIX
// SOCK_SEQPACKET socket pair. Created before fork(); every process holding a copy
// may put() and get(). Each message is delivered whole, to exactly one getter,
// which makes it safe for many producers and many consumers.
class Channel {
    public:
        Channel();
        ~Channel();

        Channel(const Channel &) = delete;
        Channel & operator=(const Channel &) = delete;

        // blocks while the channel is full; throws TransportError if `msg` is larger
        // than max_message_size() or cannot be sent
        void put(const std::string & msg) const;

        // blocks until a message is available
        std::string get() const;

        // true if a message can be read without blocking, waiting at most `timeout_ms`
        bool poll(const int timeout_ms) const;

        size_t max_message_size() const { return _max_message; }

    private:
        int _send_fd;
        int _recv_fd;
        size_t _max_message;
};

}

#endif // ABCPOP_CHANNEL_H
