#include "protocol/field_encoder.h"
#include "protocol/fix_fields.h"
#include <cstdio>

namespace fix_order_entry::protocol
{
    namespace FieldEncoder
    {
        namespace
        {
            std::string render(int tag, const std::string &value)
            {
                std::string field;
                field.reserve(value.size() + 8);
                field += std::to_string(tag);
                field += '=';
                field += value;
                field += FIX_SOH;
                return field;
            }
        }

        std::string encode(int tag, int value)
        {
            return render(tag, std::to_string(value));
        }

        std::string encode(int tag, int64_t value)
        {
            return render(tag, std::to_string(value));
        }

        std::string encode(int tag, size_t value)
        {
            return render(tag, std::to_string(value));
        }

        std::string encode(int tag, char value)
        {
            return render(tag, std::string(1, value));
        }

        std::string encode(int tag, Price value)
        {
            return render(tag, formatPrice(value.value));
        }

        std::string encode(int tag, const std::string &value)
        {
            return render(tag, trim(value));
        }

        std::string formatPrice(double price, int precision)
        {
            char buffer[64];
            int written = std::snprintf(buffer, sizeof(buffer), "%.*f", precision, price);
            if (written < 0)
            {
                return std::string();
            }
            if (static_cast<size_t>(written) < sizeof(buffer))
            {
                return std::string(buffer, static_cast<size_t>(written));
            }

            // Large magnitudes print every integer digit; format again at full length
            std::string text(static_cast<size_t>(written) + 1, '\0');
            std::snprintf(&text[0], text.size(), "%.*f", precision, price);
            text.resize(static_cast<size_t>(written));
            return text;
        }

        std::string trim(const std::string &value)
        {
            const char *whitespace = " \t\r\n\v\f";
            size_t first = value.find_first_not_of(whitespace);
            if (first == std::string::npos)
            {
                return std::string();
            }
            size_t last = value.find_last_not_of(whitespace);
            return value.substr(first, last - first + 1);
        }
    }
} // namespace fix_order_entry::protocol
