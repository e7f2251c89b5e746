#pragma once

#include "fix_fields.h"
#include "field_encoder.h"
#include "order_request.h"
#include "session/fix_session.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace fix_order_entry::protocol
{
    class FixBuilder
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;
        using ClOrdIdGenerator = std::function<std::string()>;

        // Builder configuration. Clock and generator are injectable so built
        // messages are reproducible under test.
        struct BuilderConfig
        {
            std::string beginString = FIX_VERSION_42;
            Clock clock;                       // defaults to system_clock::now
            ClOrdIdGenerator clOrdIdGenerator; // defaults to FixBuilderUtils::generateClOrdID
        };

        // Builder statistics for monitoring
        struct BuilderStats
        {
            uint64_t messagesBuildAttempts = 0;
            uint64_t messagesBuildSuccess = 0;
            uint64_t messagesBuildFailure = 0;
            uint64_t lastBuildTimeNanos = 0;

            void reset();
        };

        FixBuilder();
        explicit FixBuilder(const BuilderConfig &config);

        FixBuilder(const FixBuilder &) = default;
        FixBuilder(FixBuilder &&) = default;
        FixBuilder &operator=(const FixBuilder &) = default;
        FixBuilder &operator=(FixBuilder &&) = default;

        const BuilderConfig &getConfig() const { return config_; }

        // Builds 8=FIX.4.2|9=..|35=D|...|44=..|10=..| and consumes one MsgSeqNum
        // from the session. Throws ValidationError before touching the session
        // when the order is invalid or addressed to a different CompID pair.
        std::string buildNewOrderSingle(session::FixSession &session, const OrderRequest &order);

        const BuilderStats &getStats() const { return stats_; }
        void resetStats() { stats_.reset(); }

    private:
        BuilderConfig config_;
        BuilderStats stats_;

        std::string buildImpl(session::FixSession &session, const OrderRequest &order);
        std::string encodeBody(const std::string &senderCompID, const std::string &targetCompID,
                               int32_t seqNum, const std::string &timestamp,
                               const std::string &clOrdID, const OrderRequest &order) const;
        std::string assemble(const std::string &body) const;
    };

    namespace FixBuilderUtils
    {
        // "ORD-<epoch millis>-<n>", unique within the process
        std::string generateClOrdID(const std::string &prefix = constants::CL_ORD_ID_PREFIX);
    }

} // namespace fix_order_entry::protocol
