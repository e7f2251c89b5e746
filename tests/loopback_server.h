#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

namespace fix_order_entry::test
{
    // One-shot TCP peer on 127.0.0.1 with an ephemeral port. Accepts a single
    // connection and hands it to the scripted behaviour on its own thread;
    // the connection is closed when the behaviour returns.
    class LoopbackServer
    {
    public:
        // Scripted peer side for the accepted connection
        using Behaviour = std::function<void(LoopbackServer &server, int client_fd)>;

        explicit LoopbackServer(Behaviour behaviour)
        {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listen_fd_ < 0)
            {
                throw std::runtime_error("socket() failed");
            }
            int reuse = 1;
            setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
                ::listen(listen_fd_, 4) < 0)
            {
                ::close(listen_fd_);
                throw std::runtime_error("bind/listen failed");
            }
            port_ = boundPort(listen_fd_);

            worker_ = std::thread([this, behaviour]()
                                  {
                int client = acceptWithTimeout(std::chrono::seconds(5));
                if (client < 0)
                {
                    received_.set_value(std::string());
                    return;
                }
                behaviour(*this, client);
                ::close(client); });
        }

        ~LoopbackServer()
        {
            if (worker_.joinable())
            {
                worker_.join();
            }
            ::close(listen_fd_);
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        int port() const { return port_; }

        // Message captured by readMessage()
        std::string received(std::chrono::milliseconds timeout = std::chrono::seconds(5))
        {
            auto future = received_.get_future();
            if (future.wait_for(timeout) != std::future_status::ready)
            {
                return std::string();
            }
            return future.get();
        }

        // Reads one complete FIX message (through the CheckSum field) and
        // publishes it through received()
        void readMessage(int fd, std::chrono::milliseconds timeout = std::chrono::seconds(5))
        {
            const std::string trailer = std::string(1, '\x01') + "10=";
            std::string data;
            size_t scan_from = 0;
            auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true)
            {
                size_t pos = data.find(trailer, scan_from);
                if (pos != std::string::npos && data.size() >= pos + trailer.size() + 4)
                {
                    break;
                }
                if (pos != std::string::npos)
                {
                    scan_from = pos;
                }
                else if (data.size() >= trailer.size())
                {
                    scan_from = data.size() - trailer.size() + 1;
                }
                if (!readSome(fd, data, deadline))
                {
                    break;
                }
            }
            received_.set_value(data);
        }

        // Blocks until the client closes its end
        void waitForClose(int fd, std::chrono::milliseconds timeout = std::chrono::seconds(5))
        {
            std::string ignored;
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (readSome(fd, ignored, deadline))
            {
            }
        }

        static void sendAll(int fd, const std::string &data)
        {
            size_t offset = 0;
            while (offset < data.size())
            {
                ssize_t n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
                if (n <= 0)
                {
                    return;
                }
                offset += static_cast<size_t>(n);
            }
        }

        // A port with nothing listening on it
        static int unusedPort()
        {
            int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            int port = boundPort(fd);
            ::close(fd);
            return port;
        }

    private:
        static int boundPort(int fd)
        {
            sockaddr_in bound;
            socklen_t len = sizeof(bound);
            std::memset(&bound, 0, sizeof(bound));
            ::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len);
            return ntohs(bound.sin_port);
        }

        static bool readSome(int fd, std::string &data, std::chrono::steady_clock::time_point deadline)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                return false;
            }
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
            {
                return false;
            }
            char buffer[64 * 1024];
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
            {
                return false;
            }
            data.append(buffer, static_cast<size_t>(n));
            return true;
        }

        int acceptWithTimeout(std::chrono::milliseconds timeout)
        {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
            {
                return -1;
            }
            return ::accept(listen_fd_, nullptr, nullptr);
        }

        int listen_fd_ = -1;
        int port_ = 0;
        std::promise<std::string> received_;
        std::thread worker_;
    };

    // Listener with a zero backlog that never accepts. The accept queue is
    // filled on construction, so further SYNs are dropped and connects hang.
    class SaturatedListener
    {
    public:
        SaturatedListener()
        {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listen_fd_ < 0)
            {
                throw std::runtime_error("socket() failed");
            }

            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
                ::listen(listen_fd_, 0) < 0)
            {
                ::close(listen_fd_);
                throw std::runtime_error("bind/listen failed");
            }

            socklen_t len = sizeof(addr);
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
            port_ = ntohs(addr.sin_port);

            for (int i = 0; i < 3; ++i)
            {
                int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
                if (fd < 0)
                {
                    continue;
                }
                ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
                fillers_[i] = fd;
            }
            // Let the first handshake land in the accept queue
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        ~SaturatedListener()
        {
            for (int fd : fillers_)
            {
                if (fd >= 0)
                {
                    ::close(fd);
                }
            }
            ::close(listen_fd_);
        }

        SaturatedListener(const SaturatedListener &) = delete;
        SaturatedListener &operator=(const SaturatedListener &) = delete;

        int port() const { return port_; }

    private:
        int listen_fd_ = -1;
        int port_ = 0;
        int fillers_[3] = {-1, -1, -1};
    };

} // namespace fix_order_entry::test
