#pragma once

#include "session/sequence_counter.h"
#include <cstdint>
#include <mutex>
#include <string>

namespace fix_order_entry::session
{
    // One sender/target pair and its outgoing sequence. Lives as long as the
    // owning client; nothing is persisted. Safe to share across threads.
    class FixSession
    {
    public:
        FixSession(const std::string &senderCompID, const std::string &targetCompID,
                   int32_t initialSeqNum = constants::INITIAL_SEQUENCE_NUMBER);

        // Non-copyable (owns a mutex)
        FixSession(const FixSession &) = delete;
        FixSession &operator=(const FixSession &) = delete;

        const std::string &getSenderCompID() const { return sender_comp_id_; }
        const std::string &getTargetCompID() const { return target_comp_id_; }

        int32_t nextSeqNum();
        int32_t peekSeqNum() const;
        void resetSequence();

    private:
        const std::string sender_comp_id_;
        const std::string target_comp_id_;

        SequenceCounter counter_;
        mutable std::mutex mutex_;
    };

} // namespace fix_order_entry::session
