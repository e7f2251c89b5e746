#include "network/tcp_connection.h"
#include "utils/logger.h"
#include "utils/performance_counters.h"
#include <fcntl.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <poll.h>
#include <cstring>
#include <cerrno>
#include <memory>
#include <unistd.h>

namespace fix_order_entry::network
{
    using namespace constants;      // For cleaner constant usage
    using namespace utils::metrics; // For performance metrics

    namespace
    {
        struct AddrInfoDeleter
        {
            void operator()(struct addrinfo *info) const
            {
                if (info)
                {
                    freeaddrinfo(info);
                }
            }
        };

        int remainingMillis(std::chrono::steady_clock::time_point deadline)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
        }
    }

    TcpConnection::TcpConnection()
        : socket_fd_(INVALID_SOCKET), connected_(false), port_(0), last_errno_(0) {}

    TcpConnection::~TcpConnection()
    {
        close();
    }

    bool TcpConnection::createSocket(int family)
    {
        socket_fd_ = ::socket(family, SOCK_STREAM, 0);
        if (socket_fd_ == INVALID_SOCKET)
        {
            handleSocketError(errno, "Failed to create socket");
            return false;
        }
        LOG_DEBUG("Socket created successfully");
        return true;
    }

    bool TcpConnection::configureSocket()
    {
        // 1. TCP_NODELAY - a single small order should leave immediately
        int nodelay = 1;
        if (setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0)
        {
            LOG_WARN("Failed to set TCP_NODELAY - continuing anyway");
        }

        // 2. Non-blocking mode so connect/send/recv can be bounded by poll()
        int flags = fcntl(socket_fd_, F_GETFL, 0);
        if (flags < 0)
        {
            handleSocketError(errno, "Failed to get socket flags");
            return false;
        }
        if (fcntl(socket_fd_, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            handleSocketError(errno, "Failed to set non-blocking mode");
            return false;
        }
        LOG_DEBUG("Non-blocking mode configured");
        return true;
    }

    TcpConnection::ConnectResult TcpConnection::connect(const std::string &host, int port,
                                                        std::chrono::milliseconds timeout)
    {
        close();

        host_ = host;
        port_ = port;
        last_error_.clear();
        last_errno_ = 0;

        if (port <= 0 || port > 65535)
        {
            last_error_ = "Invalid port " + std::to_string(port);
            LOG_ERROR(last_error_);
            return ConnectResult::Error;
        }

        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo *raw = nullptr;
        std::string service = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
        std::unique_ptr<struct addrinfo, AddrInfoDeleter> addresses(raw);
        if (rc != 0 || !addresses)
        {
            last_error_ = "Failed to resolve host " + host + ": " + gai_strerror(rc);
            LOG_ERROR(last_error_);
            return ConnectResult::ResolveFailed;
        }

        // One deadline covers every candidate address
        auto deadline = std::chrono::steady_clock::now() + timeout;
        ConnectResult result = ConnectResult::Error;

        for (struct addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
        {
            if (!createSocket(ai->ai_family))
            {
                result = ConnectResult::Error;
                continue;
            }
            if (!configureSocket())
            {
                close();
                result = ConnectResult::Error;
                continue;
            }

            result = connectAddress(ai->ai_addr, ai->ai_addrlen, deadline);
            if (result == ConnectResult::Connected)
            {
                connected_ = true;
                LOG_INFO("Connected to " + host + ":" + std::to_string(port));
                return result;
            }

            close();
            if (result == ConnectResult::TimedOut)
            {
                break;
            }
        }

        return result;
    }

    TcpConnection::ConnectResult TcpConnection::connectAddress(const struct sockaddr *addr, socklen_t addr_len,
                                                               std::chrono::steady_clock::time_point deadline)
    {
        if (::connect(socket_fd_, addr, addr_len) == 0)
        {
            return ConnectResult::Connected;
        }

        int error = errno;
        if (error != EINPROGRESS && error != EINTR)
        {
            handleSocketError(error, "connect");
            return error == ECONNREFUSED ? ConnectResult::Refused : ConnectResult::Error;
        }

        int ready = waitFor(POLLOUT, deadline);
        if (ready == 0)
        {
            last_error_ = "Connect to " + host_ + ":" + std::to_string(port_) + " timed out";
            LOG_WARN(last_error_);
            return ConnectResult::TimedOut;
        }
        if (ready < 0)
        {
            return ConnectResult::Error;
        }

        // Writable: the pending connect finished, SO_ERROR tells how
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket_fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
        {
            handleSocketError(errno, "getsockopt(SO_ERROR)");
            return ConnectResult::Error;
        }
        if (so_error != 0)
        {
            handleSocketError(so_error, "connect");
            return so_error == ECONNREFUSED ? ConnectResult::Refused : ConnectResult::Error;
        }

        return ConnectResult::Connected;
    }

    bool TcpConnection::sendAll(const std::string &message, std::chrono::milliseconds timeout)
    {
        if (!connected_)
        {
            last_error_ = "Cannot send: not connected";
            LOG_ERROR(last_error_);
            return false;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        const char *data = message.data();
        size_t remaining = message.size();

        while (remaining > 0)
        {
            // MSG_NOSIGNAL avoids SIGPIPE on broken connections
            ssize_t sent = ::send(socket_fd_, data, remaining, MSG_NOSIGNAL);
            if (sent > 0)
            {
                data += sent;
                remaining -= static_cast<size_t>(sent);
                if (remaining > 0)
                {
                    LOG_DEBUG("Partial send, " + std::to_string(remaining) + " bytes remaining");
                }
                continue;
            }

            int error = errno;
            if (sent < 0 && error == EINTR)
            {
                continue;
            }
            if (sent < 0 && (error == EAGAIN || error == EWOULDBLOCK))
            {
                int ready = waitFor(POLLOUT, deadline);
                if (ready == 0)
                {
                    last_error_ = "Send timed out with " + std::to_string(remaining) + " bytes unsent";
                    last_errno_ = ETIMEDOUT;
                    LOG_ERROR(last_error_);
                    return false;
                }
                if (ready < 0)
                {
                    return false;
                }
                continue;
            }

            handleSocketError(sent < 0 ? error : EPIPE, "send");
            return false;
        }

        PERF_COUNTER_ADD(BYTES_SENT, message.size());
        PERF_COUNTER_INC(MESSAGES_SENT);
        LOG_DEBUG("Sent " + std::to_string(message.size()) + " bytes");
        return true;
    }

    TcpConnection::ReceiveResult TcpConnection::receiveOnce(std::string &data, size_t max_bytes,
                                                            std::chrono::milliseconds timeout)
    {
        data.clear();
        if (!connected_)
        {
            last_error_ = "Cannot receive: not connected";
            LOG_ERROR(last_error_);
            return ReceiveResult::Error;
        }
        if (max_bytes == 0)
        {
            max_bytes = RESPONSE_BUFFER_SIZE;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string buffer(max_bytes, '\0');

        while (true)
        {
            int ready = waitFor(POLLIN, deadline);
            if (ready == 0)
            {
                LOG_DEBUG("No response within " + std::to_string(timeout.count()) + "ms");
                return ReceiveResult::TimedOut;
            }
            if (ready < 0)
            {
                return ReceiveResult::Error;
            }

            ssize_t received = ::recv(socket_fd_, &buffer[0], buffer.size(), 0);
            if (received > 0)
            {
                data.assign(buffer.data(), static_cast<size_t>(received));
                PERF_COUNTER_ADD(BYTES_RECEIVED, received);
                PERF_COUNTER_INC(MESSAGES_RECEIVED);
                LOG_DEBUG("Received " + std::to_string(received) + " bytes");
                return ReceiveResult::Data;
            }
            if (received == 0)
            {
                LOG_INFO("Connection closed by peer");
                connected_ = false;
                return ReceiveResult::Closed;
            }

            int error = errno;
            if (error == EINTR || error == EAGAIN || error == EWOULDBLOCK)
            {
                continue;
            }

            handleSocketError(error, "recv");
            return error == ECONNRESET ? ReceiveResult::Closed : ReceiveResult::Error;
        }
    }

    int TcpConnection::waitFor(short events, std::chrono::steady_clock::time_point deadline)
    {
        struct pollfd pfd;
        pfd.fd = socket_fd_;
        pfd.events = events;
        pfd.revents = 0;

        while (true)
        {
            int rc = ::poll(&pfd, 1, remainingMillis(deadline));
            if (rc >= 0)
            {
                // POLLHUP/POLLERR count as ready; the following call reports the cause
                return rc > 0 ? 1 : 0;
            }
            if (errno == EINTR)
            {
                continue;
            }
            handleSocketError(errno, "poll");
            return -1;
        }
    }

    void TcpConnection::close()
    {
        if (socket_fd_ != INVALID_SOCKET)
        {
            ::close(socket_fd_);
            socket_fd_ = INVALID_SOCKET;
            LOG_DEBUG("Socket closed");
        }
        connected_ = false;
    }

    void TcpConnection::handleSocketError(int error, const std::string &context)
    {
        std::string error_msg;

        switch (error)
        {
        case ECONNREFUSED:
            error_msg = "Connection refused";
            break;
        case ECONNRESET:
            error_msg = "Connection reset by peer";
            connected_ = false;
            break;
        case EPIPE:
            error_msg = "Broken pipe (connection closed)";
            connected_ = false;
            break;
        case ENOTCONN:
            error_msg = "Socket not connected";
            connected_ = false;
            break;
        case ENETUNREACH:
        case EHOSTUNREACH:
            error_msg = "Host unreachable";
            break;
        default:
            error_msg = "Socket error: " + std::string(strerror(error));
            break;
        }

        last_errno_ = error;
        last_error_ = context + ": " + error_msg;

        if (error == ECONNREFUSED || error == ECONNRESET)
        {
            LOG_WARN("Socket error [" + std::to_string(error) + "] " + last_error_);
        }
        else
        {
            LOG_ERROR("Socket error [" + std::to_string(error) + "] " + last_error_);
        }
    }

} // namespace fix_order_entry::network
