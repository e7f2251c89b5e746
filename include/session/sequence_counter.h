#pragma once

#include "common/constants.h"
#include <cstdint>

namespace fix_order_entry::session
{
    // Outgoing MsgSeqNum source. Not synchronized: FixSession serializes access.
    class SequenceCounter
    {
    public:
        explicit SequenceCounter(int32_t initial = constants::INITIAL_SEQUENCE_NUMBER);

        // Returns the current number and advances by one
        int32_t next();

        // Number the next call to next() will return
        int32_t peek() const { return next_; }

        // Restore the initial value
        void reset();

        int32_t initialValue() const { return initial_; }

    private:
        int32_t initial_;
        int32_t next_;
    };

} // namespace fix_order_entry::session
