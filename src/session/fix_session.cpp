#include "session/fix_session.h"
#include "utils/logger.h"
#include <stdexcept>

namespace fix_order_entry::session
{
    FixSession::FixSession(const std::string &senderCompID, const std::string &targetCompID,
                           int32_t initialSeqNum)
        : sender_comp_id_(senderCompID),
          target_comp_id_(targetCompID),
          counter_(initialSeqNum)
    {
        if (sender_comp_id_.empty() || target_comp_id_.empty())
        {
            throw std::invalid_argument("SenderCompID and TargetCompID must be provided");
        }
    }

    int32_t FixSession::nextSeqNum()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counter_.next();
    }

    int32_t FixSession::peekSeqNum() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counter_.peek();
    }

    void FixSession::resetSequence()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            counter_.reset();
        }
        LOG_INFO("Sequence number reset for " + sender_comp_id_ + "->" + target_comp_id_ +
                 ", next MsgSeqNum=" + std::to_string(peekSeqNum()));
    }

} // namespace fix_order_entry::session
