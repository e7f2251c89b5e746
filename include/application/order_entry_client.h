#pragma once

#include "common/client_config.h"
#include "network/async_sender.h"
#include "network/transport_client.h"
#include "protocol/fix_builder.h"
#include "protocol/order_request.h"
#include "session/fix_session.h"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace fix_order_entry::application
{
    // Wires one session, the message builder and the transport together for
    // a single counterparty described by a ClientConfig.
    class OrderEntryClient
    {
    public:
        // Throws ConfigError if the configuration is invalid
        explicit OrderEntryClient(const common::ClientConfig &config,
                                  const protocol::FixBuilder::BuilderConfig &builder_config = {});

        ~OrderEntryClient();

        // Non-copyable
        OrderEntryClient(const OrderEntryClient &) = delete;
        OrderEntryClient &operator=(const OrderEntryClient &) = delete;

        // =================================================================
        // ORDER CONSTRUCTION
        // =================================================================

        // Orders addressed with this client's CompIDs. Throw ValidationError.
        protocol::OrderRequest makeOrder(const std::string &symbol, protocol::Side side,
                                         double quantity, double price) const;
        protocol::OrderRequest makeOrder(const std::string &symbol, const std::string &side,
                                         const std::string &quantity, const std::string &price) const;

        // =================================================================
        // SUBMISSION
        // =================================================================

        // Builds, sends and waits on the calling thread. Throws ValidationError
        // before any network activity; transport failures are in the result.
        network::SubmissionResult submit(const protocol::OrderRequest &order);

        // Same work on the background sender; progress is reported as events
        std::future<network::SubmissionResult> submitAsync(const protocol::OrderRequest &order);

        bool pollEvent(network::OrderEvent &event);
        bool waitEvent(network::OrderEvent &event, std::chrono::milliseconds timeout);

        // Stops the background sender after it finished queued orders
        void shutdown();

        // =================================================================
        // SESSION
        // =================================================================

        void resetSequence();
        int32_t peekSeqNum() const { return session_.peekSeqNum(); }

        const common::ClientConfig &getConfig() const { return config_; }
        const network::TransportOptions &getTransportOptions() const { return transport_.getOptions(); }
        protocol::FixBuilder::BuilderStats getBuilderStats() const;

        static network::TransportOptions toTransportOptions(const common::ClientConfig &config);

    private:
        common::ClientConfig config_;
        session::FixSession session_;

        protocol::FixBuilder builder_;
        mutable std::mutex builder_mutex_;

        network::TransportClient transport_;
        network::Endpoint endpoint_;
        std::unique_ptr<network::AsyncSender> async_sender_;
    };

} // namespace fix_order_entry::application
