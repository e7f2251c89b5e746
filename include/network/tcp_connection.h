#pragma once

#include <chrono>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>
#include "common/constants.h"

namespace fix_order_entry::network
{
    // Blocking-style TCP connection built on a non-blocking socket plus poll(),
    // so every step honours a timeout. The socket is closed by close() or the
    // destructor, whichever runs first.
    class TcpConnection
    {
    public:
        enum class ConnectResult
        {
            Connected,
            Refused,       // ECONNREFUSED from the peer
            TimedOut,      // connect did not complete in time
            ResolveFailed, // host name could not be resolved
            Error          // any other OS-level failure
        };

        enum class ReceiveResult
        {
            Data,     // at least one byte read
            Closed,   // orderly shutdown or reset by the peer
            TimedOut, // nothing arrived before the timeout
            Error
        };

        TcpConnection();
        ~TcpConnection();

        // Non-copyable, non-movable
        TcpConnection(const TcpConnection &) = delete;
        TcpConnection &operator=(const TcpConnection &) = delete;
        TcpConnection(TcpConnection &&) = delete;
        TcpConnection &operator=(TcpConnection &&) = delete;

        // Step 1: Connection Establishment
        ConnectResult connect(const std::string &host, int port, std::chrono::milliseconds timeout);

        // Step 2: Data Sending (loops over partial writes)
        bool sendAll(const std::string &message, std::chrono::milliseconds timeout);

        // Step 3: Single bounded read
        ReceiveResult receiveOnce(std::string &data, size_t max_bytes, std::chrono::milliseconds timeout);

        // Step 4: Connection Management
        bool isConnected() const { return connected_; }
        bool isOpen() const { return socket_fd_ != constants::INVALID_SOCKET; }
        void close();

        // Error details of the last failed step
        std::string getLastError() const { return last_error_; }
        int getLastErrno() const { return last_errno_; }

        // Connection info
        std::string getRemoteHost() const { return host_; }
        int getRemotePort() const { return port_; }

    private:
        int socket_fd_;
        bool connected_;

        std::string host_;
        int port_;

        std::string last_error_;
        int last_errno_;

        bool createSocket(int family);
        bool configureSocket();
        ConnectResult connectAddress(const struct sockaddr *addr, socklen_t addr_len,
                                     std::chrono::steady_clock::time_point deadline);

        // poll() wrapper; returns 1 ready, 0 timeout, -1 error
        int waitFor(short events, std::chrono::steady_clock::time_point deadline);

        void handleSocketError(int error, const std::string &context);
    };
} // namespace fix_order_entry::network
