#pragma once

#include <string>

namespace fix_order_entry::protocol
{
    // FIX Protocol Constants
    constexpr char FIX_SOH = '\001'; // Start of Header delimiter (ASCII 1)
    constexpr const char *FIX_VERSION_42 = "FIX.4.2";

    // FIX 4.2 field tags used by order entry
    namespace FixFields
    {
        // Standard header / trailer
        constexpr int BeginString = 8;   // FIX version
        constexpr int BodyLength = 9;    // Message length
        constexpr int CheckSum = 10;     // Message checksum
        constexpr int MsgType = 35;      // Message type
        constexpr int MsgSeqNum = 34;    // Message sequence number
        constexpr int SenderCompID = 49; // Sender ID
        constexpr int TargetCompID = 56; // Target ID
        constexpr int SendingTime = 52;  // Message timestamp

        // Order fields
        constexpr int ClOrdID = 11;      // Client order ID
        constexpr int HandlInst = 21;    // Handling instruction
        constexpr int Symbol = 55;       // Instrument symbol
        constexpr int Side = 54;         // Buy/Sell side
        constexpr int TransactTime = 60; // Transaction time
        constexpr int OrderQty = 38;     // Order quantity
        constexpr int OrdType = 40;      // Order type
        constexpr int Price = 44;        // Order price

        // Fields commonly seen in counterparty responses
        constexpr int OrderID = 37;   // Exchange order ID
        constexpr int ExecID = 17;    // Execution ID
        constexpr int OrdStatus = 39; // Order status
        constexpr int ExecType = 150; // Execution type
        constexpr int Text = 58;      // Free text
    }

    namespace MsgTypes
    {
        constexpr const char *Reject = "3";
        constexpr const char *ExecutionReport = "8";
        constexpr const char *NewOrderSingle = "D";
    }

    namespace HandlInstValues
    {
        constexpr char AutomatedPrivate = '1'; // automated execution, no broker intervention
    }

    namespace OrdTypeValues
    {
        constexpr char Limit = '2';
    }

    // Readable names for display
    namespace FieldNames
    {
        std::string getFieldName(int fieldTag);
    }

} // namespace fix_order_entry::protocol
