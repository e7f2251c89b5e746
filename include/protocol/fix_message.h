#pragma once

#include "fix_fields.h"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace fix_order_entry::protocol
{
    // Ordered, read-only view of a raw FIX message. Used to inspect what was
    // built and to render counterparty responses for display.
    class FixMessage
    {
    public:
        using Field = std::pair<int, std::string>;
        using FieldList = std::vector<Field>;
        using FieldIterator = FieldList::const_iterator;

        FixMessage() = default;
        explicit FixMessage(const std::string &rawMessage);

        // Field access (first occurrence of the tag)
        bool getField(int tag, std::string &value) const;
        bool getField(int tag, int &value) const;
        bool getField(int tag, double &value) const;
        const std::string *getFieldPtr(int tag) const;
        bool hasField(int tag) const;

        // Common field accessors
        std::string getMsgType() const { return getFieldValue(FixFields::MsgType); }
        std::string getClOrdID() const { return getFieldValue(FixFields::ClOrdID); }
        std::string getSymbol() const { return getFieldValue(FixFields::Symbol); }
        std::string getSide() const { return getFieldValue(FixFields::Side); }
        std::string getOrderQty() const { return getFieldValue(FixFields::OrderQty); }
        std::string getPrice() const { return getFieldValue(FixFields::Price); }
        int getMsgSeqNum() const;

        // Trailer checks against the raw bytes
        bool isChecksumCorrect() const;
        bool isBodyLengthCorrect() const;

        // Metadata
        size_t getFieldCount() const { return fields_.size(); }
        const FieldList &getFields() const { return fields_; }
        const std::string &getRawMessage() const { return raw_; }
        bool empty() const { return fields_.empty(); }

        FieldIterator begin() const { return fields_.begin(); }
        FieldIterator end() const { return fields_.end(); }

        // Debug and logging
        std::string toFormattedString() const; // One "Name(tag)=value" per line

    private:
        FieldList fields_;
        std::string raw_;

        std::string getFieldValue(int tag) const;
        void parseFromString(const std::string &rawMessage);
    };

    namespace FixMessageUtils
    {
        // Checksum of the given bytes: sum mod 256, three digits zero padded
        std::string calculateChecksum(const std::string &message);
        bool verifyChecksum(const std::string &message);

        // Bytes between the end of the BodyLength field and the start of CheckSum.
        // Returns false if the message has no recognisable header/trailer.
        bool calculateBodyLength(const std::string &message, size_t &bodyLength);
        bool verifyBodyLength(const std::string &message);

        // UTC "YYYYMMDD-HH:MM:SS"
        std::string formatFixTime(const std::chrono::system_clock::time_point &time);

        // SOH replaced by " | " for display
        std::string toReadable(const std::string &rawMessage);
    }

} // namespace fix_order_entry::protocol
