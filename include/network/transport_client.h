#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <variant>
#include "common/constants.h"

namespace fix_order_entry::network
{
    struct TransportOptions
    {
        std::chrono::milliseconds connect_timeout{constants::CONNECTION_TIMEOUT_MS};
        std::chrono::milliseconds read_timeout{constants::RECV_TIMEOUT_MS};
        size_t max_response_size = constants::RESPONSE_BUFFER_SIZE;
    };

    enum class TransportErrorCode
    {
        INVALID_ARGUMENT,
        RESOLVE_FAILED,
        SOCKET_FAILED,
        CONNECT_FAILED,
        CONNECT_TIMEOUT,
        SEND_FAILED,
        RECEIVE_FAILED
    };

    // Outcomes of one send-and-read-once exchange

    struct Received
    {
        std::string bytes;
    };

    struct TimedOut
    {
        std::chrono::milliseconds waited{0};
    };

    struct ClosedByPeer
    {
    };

    struct Refused
    {
        std::string host;
        int port = 0;
    };

    struct TransportError
    {
        TransportErrorCode code = TransportErrorCode::CONNECT_FAILED;
        std::string detail;
    };

    using TransportOutcome = std::variant<Received, TimedOut, ClosedByPeer, Refused, TransportError>;

    class TransportClient
    {
    public:
        TransportClient() = default;
        explicit TransportClient(const TransportOptions &options) : options_(options) {}

        const TransportOptions &getOptions() const { return options_; }
        void setOptions(const TransportOptions &options) { options_ = options; }

        // Opens a fresh connection, writes the whole message, waits for one
        // read, then closes. Never throws; every failure is an outcome.
        TransportOutcome send(const std::string &host, int port, const std::string &message) const;
        static TransportOutcome send(const std::string &host, int port, const std::string &message,
                                     const TransportOptions &options);

    private:
        TransportOptions options_;

        static TransportOutcome exchange(const std::string &host, int port, const std::string &message,
                                         const TransportOptions &options);
    };

    // Received, TimedOut and ClosedByPeer all mean the order left this process
    bool isDelivered(const TransportOutcome &outcome);
    bool isError(const TransportOutcome &outcome);

    const char *outcomeName(const TransportOutcome &outcome);
    const char *errorCodeName(TransportErrorCode code);
    std::string describe(const TransportOutcome &outcome);

} // namespace fix_order_entry::network
