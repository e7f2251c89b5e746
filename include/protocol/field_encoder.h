#pragma once

#include "common/constants.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace fix_order_entry::protocol
{
    // Limit price value. Rendered with PRICE_PRECISION fractional digits.
    struct Price
    {
        double value = 0.0;

        Price() = default;
        explicit Price(double v) : value(v) {}
    };

    // Renders tag/value pairs into their wire form: tag '=' value SOH.
    // Values are written verbatim (strings are trimmed); no escaping is done,
    // so callers must keep SOH out of values.
    namespace FieldEncoder
    {
        std::string encode(int tag, int value);
        std::string encode(int tag, int64_t value);
        std::string encode(int tag, size_t value);
        std::string encode(int tag, char value);
        std::string encode(int tag, Price value);
        std::string encode(int tag, const std::string &value);

        // In-place variant used on the build path
        template <typename T>
        void appendField(std::string &buffer, int tag, const T &value)
        {
            buffer += encode(tag, value);
        }

        // Value formatting helpers
        std::string formatPrice(double price, int precision = constants::PRICE_PRECISION);
        std::string trim(const std::string &value);
    }

} // namespace fix_order_entry::protocol
