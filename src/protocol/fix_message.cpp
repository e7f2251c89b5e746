#include "protocol/fix_message.h"
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fix_order_entry::protocol
{
    namespace
    {
        // Offset of the "10=" field, or npos
        size_t findChecksumField(const std::string &message)
        {
            if (message.compare(0, 3, "10=") == 0)
            {
                return 0;
            }

            const std::string marker = std::string(1, FIX_SOH) + "10=";
            size_t pos = message.rfind(marker);
            return pos == std::string::npos ? std::string::npos : pos + 1;
        }
    }

    FixMessage::FixMessage(const std::string &rawMessage)
    {
        parseFromString(rawMessage);
    }

    bool FixMessage::getField(int tag, std::string &value) const
    {
        const std::string *ptr = getFieldPtr(tag);
        if (!ptr)
        {
            return false;
        }
        value = *ptr;
        return true;
    }

    bool FixMessage::getField(int tag, int &value) const
    {
        const std::string *ptr = getFieldPtr(tag);
        if (!ptr)
        {
            return false;
        }

        try
        {
            size_t consumed = 0;
            int parsed = std::stoi(*ptr, &consumed);
            if (consumed != ptr->size())
            {
                return false;
            }
            value = parsed;
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    bool FixMessage::getField(int tag, double &value) const
    {
        const std::string *ptr = getFieldPtr(tag);
        if (!ptr)
        {
            return false;
        }

        try
        {
            size_t consumed = 0;
            double parsed = std::stod(*ptr, &consumed);
            if (consumed != ptr->size())
            {
                return false;
            }
            value = parsed;
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    const std::string *FixMessage::getFieldPtr(int tag) const
    {
        for (const auto &field : fields_)
        {
            if (field.first == tag)
            {
                return &field.second;
            }
        }
        return nullptr;
    }

    bool FixMessage::hasField(int tag) const
    {
        return getFieldPtr(tag) != nullptr;
    }

    int FixMessage::getMsgSeqNum() const
    {
        int seqNum = 0;
        return getField(FixFields::MsgSeqNum, seqNum) ? seqNum : 0;
    }

    bool FixMessage::isChecksumCorrect() const
    {
        return FixMessageUtils::verifyChecksum(raw_);
    }

    bool FixMessage::isBodyLengthCorrect() const
    {
        return FixMessageUtils::verifyBodyLength(raw_);
    }

    std::string FixMessage::toFormattedString() const
    {
        std::ostringstream oss;
        for (const auto &field : fields_)
        {
            oss << FieldNames::getFieldName(field.first) << "(" << field.first << ")="
                << field.second << "\n";
        }
        return oss.str();
    }

    std::string FixMessage::getFieldValue(int tag) const
    {
        const std::string *ptr = getFieldPtr(tag);
        return ptr ? *ptr : std::string();
    }

    void FixMessage::parseFromString(const std::string &rawMessage)
    {
        raw_ = rawMessage;
        fields_.clear();

        size_t pos = 0;
        while (pos < rawMessage.length())
        {
            size_t sohPos = rawMessage.find(FIX_SOH, pos);
            if (sohPos == std::string::npos)
                sohPos = rawMessage.length();

            size_t eqPos = rawMessage.find('=', pos);
            if (eqPos != std::string::npos && eqPos < sohPos)
            {
                try
                {
                    size_t consumed = 0;
                    std::string tagText = rawMessage.substr(pos, eqPos - pos);
                    int tag = std::stoi(tagText, &consumed);
                    if (consumed == tagText.size() && tag > 0)
                    {
                        fields_.emplace_back(tag, rawMessage.substr(eqPos + 1, sohPos - eqPos - 1));
                    }
                }
                catch (const std::exception &)
                {
                    // Skip invalid field
                }
            }

            pos = sohPos + 1;
        }
    }

    namespace FixMessageUtils
    {
        std::string calculateChecksum(const std::string &message)
        {
            uint32_t sum = 0;
            for (char c : message)
            {
                sum += static_cast<uint8_t>(c);
            }

            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(3) << (sum % 256);
            return oss.str();
        }

        bool verifyChecksum(const std::string &message)
        {
            size_t checksumPos = findChecksumField(message);
            if (checksumPos == std::string::npos)
                return false;

            std::string expectedChecksum = calculateChecksum(message.substr(0, checksumPos));

            size_t checksumStart = checksumPos + 3;
            size_t checksumEnd = message.find(FIX_SOH, checksumStart);
            if (checksumEnd == std::string::npos)
                checksumEnd = message.length();

            std::string actualChecksum = message.substr(checksumStart, checksumEnd - checksumStart);

            return expectedChecksum == actualChecksum;
        }

        bool calculateBodyLength(const std::string &message, size_t &bodyLength)
        {
            // 8=...<SOH>9=...<SOH> must lead the message
            if (message.compare(0, 2, "8=") != 0)
                return false;

            size_t beginEnd = message.find(FIX_SOH);
            if (beginEnd == std::string::npos || message.compare(beginEnd + 1, 2, "9=") != 0)
                return false;

            size_t lengthEnd = message.find(FIX_SOH, beginEnd + 1);
            if (lengthEnd == std::string::npos)
                return false;

            size_t checksumPos = findChecksumField(message);
            if (checksumPos == std::string::npos || checksumPos <= lengthEnd)
                return false;

            bodyLength = checksumPos - (lengthEnd + 1);
            return true;
        }

        bool verifyBodyLength(const std::string &message)
        {
            size_t actual = 0;
            if (!calculateBodyLength(message, actual))
                return false;

            FixMessage parsed(message);
            int declared = 0;
            if (!parsed.getField(FixFields::BodyLength, declared) || declared < 0)
                return false;

            return static_cast<size_t>(declared) == actual;
        }

        std::string formatFixTime(const std::chrono::system_clock::time_point &time)
        {
            auto timeT = std::chrono::system_clock::to_time_t(time);
            std::tm utc{};
            gmtime_r(&timeT, &utc);

            std::ostringstream oss;
            oss << std::put_time(&utc, "%Y%m%d-%H:%M:%S");
            return oss.str();
        }

        std::string toReadable(const std::string &rawMessage)
        {
            std::string readable;
            readable.reserve(rawMessage.size() + rawMessage.size() / 4);
            for (char c : rawMessage)
            {
                if (c == FIX_SOH)
                {
                    readable += " | ";
                }
                else
                {
                    readable += c;
                }
            }
            return readable;
        }
    }

} // namespace fix_order_entry::protocol
