#include "protocol/fix_builder.h"
#include "protocol/fix_message.h"
#include "utils/logger.h"
#include "utils/performance_counters.h"
#include <atomic>

namespace fix_order_entry::protocol
{
    using namespace fix_order_entry::utils;

    // =================================================================
    // BuilderStats Implementation
    // =================================================================

    void FixBuilder::BuilderStats::reset()
    {
        messagesBuildAttempts = 0;
        messagesBuildSuccess = 0;
        messagesBuildFailure = 0;
        lastBuildTimeNanos = 0;
    }

    // =================================================================
    // FixBuilder Constructor and Configuration
    // =================================================================

    FixBuilder::FixBuilder()
        : FixBuilder(BuilderConfig{})
    {
    }

    FixBuilder::FixBuilder(const BuilderConfig &config)
        : config_(config)
    {
        if (config_.beginString.empty())
        {
            throw std::invalid_argument("BeginString must be provided");
        }
        if (!config_.clock)
        {
            config_.clock = []()
            { return std::chrono::system_clock::now(); };
        }
        if (!config_.clOrdIdGenerator)
        {
            config_.clOrdIdGenerator = []()
            { return FixBuilderUtils::generateClOrdID(); };
        }
    }

    // =================================================================
    // Core Building Methods
    // =================================================================

    std::string FixBuilder::buildNewOrderSingle(session::FixSession &session, const OrderRequest &order)
    {
        auto start = std::chrono::steady_clock::now();
        stats_.messagesBuildAttempts++;

        try
        {
            std::string result = buildImpl(session, order);
            stats_.messagesBuildSuccess++;
            stats_.lastBuildTimeNanos = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count());
            PERF_COUNTER_INC(metrics::ORDERS_BUILT);
            return result;
        }
        catch (const ValidationError &e)
        {
            stats_.messagesBuildFailure++;
            PERF_COUNTER_INC(metrics::ORDERS_REJECTED);
            LOG_WARN(std::string("NewOrderSingle rejected: ") + e.what());
            throw;
        }
        catch (const std::exception &e)
        {
            stats_.messagesBuildFailure++;
            LOG_ERROR(std::string("NewOrderSingle build failed: ") + e.what());
            throw;
        }
    }

    std::string FixBuilder::buildImpl(session::FixSession &session, const OrderRequest &order)
    {
        OrderRequest normalized = order;
        normalized.normalize();
        normalized.validate();

        if (normalized.senderCompID != session.getSenderCompID() ||
            normalized.targetCompID != session.getTargetCompID())
        {
            throw ValidationError("Order CompIDs " + normalized.senderCompID + "->" +
                                  normalized.targetCompID + " do not match session " +
                                  session.getSenderCompID() + "->" + session.getTargetCompID());
        }

        // SendingTime and TransactTime share one clock reading
        std::string timestamp = FixMessageUtils::formatFixTime(config_.clock());
        int32_t seqNum = session.nextSeqNum();
        std::string clOrdID = config_.clOrdIdGenerator();
        if (clOrdID.empty() || clOrdID.find(FIX_SOH) != std::string::npos)
        {
            throw std::runtime_error("ClOrdID generator produced an unusable identifier");
        }

        std::string body = encodeBody(session.getSenderCompID(), session.getTargetCompID(),
                                      seqNum, timestamp, clOrdID, normalized);
        std::string message = assemble(body);

        LOG_DEBUG("Built NewOrderSingle seq=" + std::to_string(seqNum) + " ClOrdID=" + clOrdID +
                  " " + FixMessageUtils::toReadable(message));
        return message;
    }

    std::string FixBuilder::encodeBody(const std::string &senderCompID, const std::string &targetCompID,
                                       int32_t seqNum, const std::string &timestamp,
                                       const std::string &clOrdID, const OrderRequest &order) const
    {
        using FieldEncoder::appendField;

        // Field order is part of the wire contract
        std::string body;
        body.reserve(192);
        appendField(body, FixFields::MsgType, std::string(MsgTypes::NewOrderSingle));
        appendField(body, FixFields::SenderCompID, senderCompID);
        appendField(body, FixFields::TargetCompID, targetCompID);
        appendField(body, FixFields::MsgSeqNum, static_cast<int>(seqNum));
        appendField(body, FixFields::SendingTime, timestamp);
        appendField(body, FixFields::ClOrdID, clOrdID);
        appendField(body, FixFields::HandlInst, HandlInstValues::AutomatedPrivate);
        appendField(body, FixFields::Symbol, order.symbol);
        appendField(body, FixFields::Side, OrderRequestUtils::sideToFixValue(order.side));
        appendField(body, FixFields::TransactTime, timestamp);
        appendField(body, FixFields::OrderQty, order.quantityUnits());
        appendField(body, FixFields::OrdType, OrdTypeValues::Limit);
        appendField(body, FixFields::Price, Price(order.price));
        return body;
    }

    std::string FixBuilder::assemble(const std::string &body) const
    {
        std::string message = FieldEncoder::encode(FixFields::BeginString, config_.beginString);
        message += FieldEncoder::encode(FixFields::BodyLength, body.size());
        message += body;
        message += FieldEncoder::encode(FixFields::CheckSum, FixMessageUtils::calculateChecksum(message));
        return message;
    }

    namespace FixBuilderUtils
    {
        std::string generateClOrdID(const std::string &prefix)
        {
            static std::atomic<uint64_t> counter{0};

            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
            uint64_t n = counter.fetch_add(1, std::memory_order_relaxed) + 1;

            return prefix + std::to_string(millis) + "-" + std::to_string(n);
        }
    }

} // namespace fix_order_entry::protocol
