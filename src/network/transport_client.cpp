#include "network/transport_client.h"
#include "network/tcp_connection.h"
#include "protocol/fix_message.h"
#include "utils/logger.h"
#include "utils/performance_counters.h"
#include <cstring>
#include <exception>
#include <type_traits>

namespace fix_order_entry::network
{
    using namespace utils::metrics;

    namespace
    {
        template <class>
        inline constexpr bool always_false_v = false;

        std::string withErrno(const TcpConnection &connection)
        {
            std::string detail = connection.getLastError();
            if (detail.empty() && connection.getLastErrno() != 0)
            {
                detail = strerror(connection.getLastErrno());
            }
            return detail;
        }
    }

    TransportOutcome TransportClient::send(const std::string &host, int port, const std::string &message) const
    {
        return send(host, port, message, options_);
    }

    TransportOutcome TransportClient::send(const std::string &host, int port, const std::string &message,
                                           const TransportOptions &options)
    {
        TransportOutcome outcome;
        try
        {
            outcome = exchange(host, port, message, options);
        }
        catch (const std::exception &e)
        {
            outcome = TransportError{TransportErrorCode::SOCKET_FAILED, e.what()};
        }

        // Step 5: Account for the outcome
        std::visit([](const auto &o)
                   {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Refused>)
            {
                PERF_COUNTER_INC(CONNECTION_REFUSED);
            }
            else if constexpr (std::is_same_v<T, TransportError>)
            {
                PERF_COUNTER_INC(CONNECTION_ERRORS);
            }
            else if constexpr (std::is_same_v<T, TimedOut>)
            {
                PERF_COUNTER_INC(READ_TIMEOUTS);
            }
            else if constexpr (std::is_same_v<T, ClosedByPeer>)
            {
                PERF_COUNTER_INC(PEER_CLOSED);
            } },
                   outcome);

        if (isError(outcome))
        {
            LOG_ERROR("Transport to " + host + ":" + std::to_string(port) + " failed: " + describe(outcome));
        }
        else
        {
            LOG_INFO("Transport to " + host + ":" + std::to_string(port) + ": " + describe(outcome));
        }
        return outcome;
    }

    TransportOutcome TransportClient::exchange(const std::string &host, int port, const std::string &message,
                                               const TransportOptions &options)
    {
        if (host.empty())
        {
            return TransportError{TransportErrorCode::INVALID_ARGUMENT, "Host must not be empty"};
        }
        if (port <= 0 || port > 65535)
        {
            return TransportError{TransportErrorCode::INVALID_ARGUMENT, "Port out of range: " + std::to_string(port)};
        }

        // Closed on every return path
        TcpConnection connection;

        // Step 1: Connect
        switch (connection.connect(host, port, options.connect_timeout))
        {
        case TcpConnection::ConnectResult::Connected:
            break;
        case TcpConnection::ConnectResult::Refused:
            return Refused{host, port};
        case TcpConnection::ConnectResult::TimedOut:
            return TransportError{TransportErrorCode::CONNECT_TIMEOUT,
                                  "No connection within " + std::to_string(options.connect_timeout.count()) + "ms"};
        case TcpConnection::ConnectResult::ResolveFailed:
            return TransportError{TransportErrorCode::RESOLVE_FAILED, connection.getLastError()};
        case TcpConnection::ConnectResult::Error:
            return TransportError{TransportErrorCode::CONNECT_FAILED, withErrno(connection)};
        }

        // Step 2: Write the whole message
        if (!connection.sendAll(message, options.connect_timeout))
        {
            return TransportError{TransportErrorCode::SEND_FAILED, withErrno(connection)};
        }

        // Step 3: One bounded read
        std::string response;
        switch (connection.receiveOnce(response, options.max_response_size, options.read_timeout))
        {
        case TcpConnection::ReceiveResult::Data:
            return Received{std::move(response)};
        case TcpConnection::ReceiveResult::Closed:
            return ClosedByPeer{};
        case TcpConnection::ReceiveResult::TimedOut:
            return TimedOut{options.read_timeout};
        case TcpConnection::ReceiveResult::Error:
            break;
        }
        return TransportError{TransportErrorCode::RECEIVE_FAILED, withErrno(connection)};
    }

    bool isDelivered(const TransportOutcome &outcome)
    {
        return std::holds_alternative<Received>(outcome) ||
               std::holds_alternative<TimedOut>(outcome) ||
               std::holds_alternative<ClosedByPeer>(outcome);
    }

    bool isError(const TransportOutcome &outcome)
    {
        return !isDelivered(outcome);
    }

    const char *outcomeName(const TransportOutcome &outcome)
    {
        return std::visit([](const auto &o) -> const char *
                          {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Received>)
                return "RECEIVED";
            else if constexpr (std::is_same_v<T, TimedOut>)
                return "TIMED_OUT";
            else if constexpr (std::is_same_v<T, ClosedByPeer>)
                return "CLOSED_BY_PEER";
            else if constexpr (std::is_same_v<T, Refused>)
                return "REFUSED";
            else if constexpr (std::is_same_v<T, TransportError>)
                return "TRANSPORT_ERROR";
            else
                static_assert(always_false_v<T>, "unhandled outcome"); },
                          outcome);
    }

    const char *errorCodeName(TransportErrorCode code)
    {
        switch (code)
        {
        case TransportErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case TransportErrorCode::RESOLVE_FAILED:
            return "RESOLVE_FAILED";
        case TransportErrorCode::SOCKET_FAILED:
            return "SOCKET_FAILED";
        case TransportErrorCode::CONNECT_FAILED:
            return "CONNECT_FAILED";
        case TransportErrorCode::CONNECT_TIMEOUT:
            return "CONNECT_TIMEOUT";
        case TransportErrorCode::SEND_FAILED:
            return "SEND_FAILED";
        case TransportErrorCode::RECEIVE_FAILED:
            return "RECEIVE_FAILED";
        default:
            return "UNKNOWN";
        }
    }

    std::string describe(const TransportOutcome &outcome)
    {
        return std::visit([](const auto &o) -> std::string
                          {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Received>)
                return "Received " + std::to_string(o.bytes.size()) + " bytes: " +
                       protocol::FixMessageUtils::toReadable(o.bytes);
            else if constexpr (std::is_same_v<T, TimedOut>)
                return "Order sent, no response within " + std::to_string(o.waited.count()) + "ms";
            else if constexpr (std::is_same_v<T, ClosedByPeer>)
                return "Order sent, connection closed by peer without a response";
            else if constexpr (std::is_same_v<T, Refused>)
                return "Connection refused by " + o.host + ":" + std::to_string(o.port);
            else if constexpr (std::is_same_v<T, TransportError>)
                return std::string(errorCodeName(o.code)) + ": " + o.detail;
            else
                static_assert(always_false_v<T>, "unhandled outcome"); },
                          outcome);
    }

} // namespace fix_order_entry::network
