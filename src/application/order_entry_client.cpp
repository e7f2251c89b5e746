#include "application/order_entry_client.h"
#include "protocol/fix_message.h"
#include "utils/logger.h"

namespace fix_order_entry::application
{
    using namespace protocol;

    namespace
    {
        const common::ClientConfig &validated(const common::ClientConfig &config)
        {
            config.validate();
            return config;
        }
    }

    OrderEntryClient::OrderEntryClient(const common::ClientConfig &config,
                                       const FixBuilder::BuilderConfig &builder_config)
        : config_(validated(config)),
          session_(config_.sender_comp_id, config_.target_comp_id, config_.initial_seq_num),
          builder_(builder_config),
          transport_(toTransportOptions(config_)),
          endpoint_{config_.host, config_.port},
          async_sender_(std::make_unique<network::AsyncSender>(session_, builder_config, endpoint_,
                                                               transport_.getOptions()))
    {
        LOG_INFO("Order entry client " + config_.sender_comp_id + "->" + config_.target_comp_id +
                 " targeting " + config_.host + ":" + std::to_string(config_.port));
    }

    OrderEntryClient::~OrderEntryClient()
    {
        shutdown();
    }

    OrderRequest OrderEntryClient::makeOrder(const std::string &symbol, Side side,
                                             double quantity, double price) const
    {
        return OrderRequest::create(symbol, side, quantity, price,
                                    session_.getSenderCompID(), session_.getTargetCompID());
    }

    OrderRequest OrderEntryClient::makeOrder(const std::string &symbol, const std::string &side,
                                             const std::string &quantity, const std::string &price) const
    {
        return makeOrder(symbol,
                         OrderRequestUtils::parseSide(side),
                         OrderRequestUtils::parseQuantity(quantity),
                         OrderRequestUtils::parsePrice(price));
    }

    network::SubmissionResult OrderEntryClient::submit(const OrderRequest &order)
    {
        network::SubmissionResult result;
        {
            std::lock_guard<std::mutex> lock(builder_mutex_);
            result.message = builder_.buildNewOrderSingle(session_, order);
        }

        FixMessage sent(result.message);
        result.clOrdID = sent.getClOrdID();
        result.msgSeqNum = sent.getMsgSeqNum();

        LOG_INFO("Sending: " + FixMessageUtils::toReadable(result.message));
        result.outcome = transport_.send(endpoint_.host, endpoint_.port, result.message);
        return result;
    }

    std::future<network::SubmissionResult> OrderEntryClient::submitAsync(const OrderRequest &order)
    {
        // Worker starts on first use
        async_sender_->start();
        return async_sender_->submit(order);
    }

    bool OrderEntryClient::pollEvent(network::OrderEvent &event)
    {
        return async_sender_->pollEvent(event);
    }

    bool OrderEntryClient::waitEvent(network::OrderEvent &event, std::chrono::milliseconds timeout)
    {
        return async_sender_->waitEvent(event, timeout);
    }

    void OrderEntryClient::shutdown()
    {
        async_sender_->stop();
    }

    void OrderEntryClient::resetSequence()
    {
        session_.resetSequence();
    }

    FixBuilder::BuilderStats OrderEntryClient::getBuilderStats() const
    {
        std::lock_guard<std::mutex> lock(builder_mutex_);
        return builder_.getStats();
    }

    network::TransportOptions OrderEntryClient::toTransportOptions(const common::ClientConfig &config)
    {
        network::TransportOptions options;
        options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
        options.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
        options.max_response_size = config.max_response_size;
        return options;
    }

} // namespace fix_order_entry::application
