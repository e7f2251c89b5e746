#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fix_order_entry::protocol
{
    // Raised for bad order input before any network activity
    class ValidationError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class Side : char
    {
        Buy = '1',
        Sell = '2'
    };

    struct OrderRequest
    {
        std::string symbol;
        Side side = Side::Buy;
        double quantity = 0.0;
        double price = 0.0;
        std::string senderCompID;
        std::string targetCompID;

        // Normalizes (trim, upper-case symbol) then validates. Throws ValidationError.
        static OrderRequest create(const std::string &symbol, Side side,
                                   double quantity, double price,
                                   const std::string &senderCompID,
                                   const std::string &targetCompID);

        void normalize();
        void validate() const;

        // Quantity as whole units (fractional part is truncated)
        int64_t quantityUnits() const;
    };

    namespace OrderRequestUtils
    {
        // Parsing of user-supplied text. Throw ValidationError on malformed input.
        Side parseSide(const std::string &side);
        double parseQuantity(const std::string &quantity);
        double parsePrice(const std::string &price);

        const char *sideToString(Side side);
        char sideToFixValue(Side side);
        std::string toUpper(const std::string &value);
    }

} // namespace fix_order_entry::protocol
