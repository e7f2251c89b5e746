#include "session/sequence_counter.h"
#include <limits>
#include <stdexcept>

namespace fix_order_entry::session
{
    SequenceCounter::SequenceCounter(int32_t initial)
        : initial_(initial), next_(initial)
    {
        if (initial < 1)
        {
            throw std::invalid_argument("Initial sequence number must be positive");
        }
    }

    int32_t SequenceCounter::next()
    {
        if (next_ == std::numeric_limits<int32_t>::max())
        {
            throw std::overflow_error("MsgSeqNum exhausted; reset the sequence");
        }
        return next_++;
    }

    void SequenceCounter::reset()
    {
        next_ = initial_;
    }

} // namespace fix_order_entry::session
