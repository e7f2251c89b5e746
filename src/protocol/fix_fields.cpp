#include "protocol/fix_fields.h"

namespace fix_order_entry::protocol
{
    namespace FieldNames
    {
        std::string getFieldName(int fieldTag)
        {
            switch (fieldTag)
            {
            case FixFields::BeginString:
                return "BeginString";
            case FixFields::BodyLength:
                return "BodyLength";
            case FixFields::CheckSum:
                return "CheckSum";
            case FixFields::MsgType:
                return "MsgType";
            case FixFields::MsgSeqNum:
                return "MsgSeqNum";
            case FixFields::SenderCompID:
                return "SenderCompID";
            case FixFields::TargetCompID:
                return "TargetCompID";
            case FixFields::SendingTime:
                return "SendingTime";
            case FixFields::ClOrdID:
                return "ClOrdID";
            case FixFields::HandlInst:
                return "HandlInst";
            case FixFields::Symbol:
                return "Symbol";
            case FixFields::Side:
                return "Side";
            case FixFields::TransactTime:
                return "TransactTime";
            case FixFields::OrderQty:
                return "OrderQty";
            case FixFields::OrdType:
                return "OrdType";
            case FixFields::Price:
                return "Price";
            case FixFields::OrderID:
                return "OrderID";
            case FixFields::ExecID:
                return "ExecID";
            case FixFields::OrdStatus:
                return "OrdStatus";
            case FixFields::ExecType:
                return "ExecType";
            case FixFields::Text:
                return "Text";
            default:
                return "Unknown";
            }
        }
    }
} // namespace fix_order_entry::protocol
