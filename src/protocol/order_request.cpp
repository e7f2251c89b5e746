#include "protocol/order_request.h"
#include "protocol/field_encoder.h"
#include "protocol/fix_fields.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace fix_order_entry::protocol
{
    namespace
    {
        void requireIdentifier(const std::string &value, const char *name)
        {
            if (value.empty())
            {
                throw ValidationError(std::string(name) + " must not be empty");
            }
            if (value.find(FIX_SOH) != std::string::npos)
            {
                throw ValidationError(std::string(name) + " must not contain the SOH delimiter");
            }
            if (value.find('=') != std::string::npos)
            {
                throw ValidationError(std::string(name) + " must not contain '='");
            }
        }

        double parseNumber(const std::string &text, const char *name)
        {
            std::string trimmed = FieldEncoder::trim(text);
            if (trimmed.empty())
            {
                throw ValidationError(std::string("Missing ") + name);
            }

            size_t consumed = 0;
            double value = 0.0;
            try
            {
                value = std::stod(trimmed, &consumed);
            }
            catch (const std::exception &)
            {
                throw ValidationError(std::string("Invalid ") + name + ": '" + text + "'");
            }

            if (consumed != trimmed.size() || !std::isfinite(value))
            {
                throw ValidationError(std::string("Invalid ") + name + ": '" + text + "'");
            }
            return value;
        }
    }

    OrderRequest OrderRequest::create(const std::string &symbol, Side side,
                                      double quantity, double price,
                                      const std::string &senderCompID,
                                      const std::string &targetCompID)
    {
        OrderRequest order;
        order.symbol = symbol;
        order.side = side;
        order.quantity = quantity;
        order.price = price;
        order.senderCompID = senderCompID;
        order.targetCompID = targetCompID;

        order.normalize();
        order.validate();
        return order;
    }

    void OrderRequest::normalize()
    {
        symbol = OrderRequestUtils::toUpper(FieldEncoder::trim(symbol));
        senderCompID = FieldEncoder::trim(senderCompID);
        targetCompID = FieldEncoder::trim(targetCompID);
    }

    void OrderRequest::validate() const
    {
        requireIdentifier(symbol, "Symbol");
        requireIdentifier(senderCompID, "SenderCompID");
        requireIdentifier(targetCompID, "TargetCompID");

        if (side != Side::Buy && side != Side::Sell)
        {
            throw ValidationError("Side must be Buy or Sell");
        }

        if (!std::isfinite(quantity) || quantity <= 0.0)
        {
            throw ValidationError("Quantity must be positive");
        }
        if (quantity >= static_cast<double>(std::numeric_limits<int64_t>::max()))
        {
            throw ValidationError("Quantity is out of range");
        }
        if (quantityUnits() < 1)
        {
            throw ValidationError("Quantity must be at least one whole unit");
        }

        if (!std::isfinite(price) || price <= 0.0)
        {
            throw ValidationError("Price must be positive");
        }
        if (std::strtod(FieldEncoder::formatPrice(price).c_str(), nullptr) <= 0.0)
        {
            throw ValidationError("Price rounds to zero at " + std::to_string(constants::PRICE_PRECISION) +
                                  " decimal places");
        }
    }

    int64_t OrderRequest::quantityUnits() const
    {
        return static_cast<int64_t>(std::trunc(quantity));
    }

    namespace OrderRequestUtils
    {
        Side parseSide(const std::string &side)
        {
            std::string value = toUpper(FieldEncoder::trim(side));
            if (value == "BUY" || value == "B" || value == "1")
            {
                return Side::Buy;
            }
            if (value == "SELL" || value == "S" || value == "2")
            {
                return Side::Sell;
            }
            throw ValidationError("Invalid side: '" + side + "' (expected BUY or SELL)");
        }

        double parseQuantity(const std::string &quantity)
        {
            return parseNumber(quantity, "quantity");
        }

        double parsePrice(const std::string &price)
        {
            return parseNumber(price, "price");
        }

        const char *sideToString(Side side)
        {
            switch (side)
            {
            case Side::Buy:
                return "BUY";
            case Side::Sell:
                return "SELL";
            default:
                return "UNKNOWN";
            }
        }

        char sideToFixValue(Side side)
        {
            return static_cast<char>(side);
        }

        std::string toUpper(const std::string &value)
        {
            std::string result = value;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return result;
        }
    }

} // namespace fix_order_entry::protocol
