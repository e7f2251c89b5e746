#include <gtest/gtest.h>
#include "protocol/field_encoder.h"
#include "protocol/fix_fields.h"
#include <algorithm>
#include <cstdlib>
#include <string>

using namespace fix_order_entry::protocol;

namespace
{
    // Test strings use '|' in place of SOH
    std::string wire(std::string text)
    {
        std::replace(text.begin(), text.end(), '|', FIX_SOH);
        return text;
    }
}

// =================================================================
// INTEGER AND CHARACTER VALUES
// =================================================================

TEST(FieldEncoderTest, EncodesIntegerAsDecimal)
{
    EXPECT_EQ(wire("34=1|"), FieldEncoder::encode(FixFields::MsgSeqNum, 1));
    EXPECT_EQ(wire("34=1024|"), FieldEncoder::encode(FixFields::MsgSeqNum, 1024));
    EXPECT_EQ(wire("38=100|"), FieldEncoder::encode(FixFields::OrderQty, int64_t{100}));
    EXPECT_EQ(wire("9=175|"), FieldEncoder::encode(FixFields::BodyLength, size_t{175}));
}

TEST(FieldEncoderTest, EncodesLargeQuantityWithoutExponent)
{
    EXPECT_EQ(wire("38=5000000000|"), FieldEncoder::encode(FixFields::OrderQty, int64_t{5000000000}));
}

TEST(FieldEncoderTest, EncodesCharacterValue)
{
    EXPECT_EQ(wire("54=1|"), FieldEncoder::encode(FixFields::Side, '1'));
    EXPECT_EQ(wire("40=2|"), FieldEncoder::encode(FixFields::OrdType, OrdTypeValues::Limit));
    EXPECT_EQ(wire("21=1|"), FieldEncoder::encode(FixFields::HandlInst, HandlInstValues::AutomatedPrivate));
}

// =================================================================
// PRICE VALUES
// =================================================================

TEST(FieldEncoderTest, PriceHasFourFractionalDigits)
{
    EXPECT_EQ(wire("44=150.0000|"), FieldEncoder::encode(FixFields::Price, Price(150.0)));
    EXPECT_EQ(wire("44=0.5000|"), FieldEncoder::encode(FixFields::Price, Price(0.5)));
    EXPECT_EQ(wire("44=99.1235|"), FieldEncoder::encode(FixFields::Price, Price(99.12345678)));
}

TEST(FieldEncoderTest, FormatPriceHonoursPrecision)
{
    EXPECT_EQ("150.0000", FieldEncoder::formatPrice(150.0));
    EXPECT_EQ("150.00", FieldEncoder::formatPrice(150.0, 2));
    EXPECT_EQ("12", FieldEncoder::formatPrice(12.0, 0));
}

TEST(FieldEncoderTest, HugePriceKeepsEveryDigit)
{
    std::string text = FieldEncoder::formatPrice(1e80);

    EXPECT_GT(text.size(), 80U);
    EXPECT_EQ(".0000", text.substr(text.size() - 5));
    EXPECT_DOUBLE_EQ(1e80, std::strtod(text.c_str(), nullptr));

    std::string field = FieldEncoder::encode(FixFields::Price, Price(1e80));
    EXPECT_EQ("44=" + text + wire("|"), field);
}

// =================================================================
// STRING VALUES
// =================================================================

TEST(FieldEncoderTest, StringIsWrittenVerbatim)
{
    EXPECT_EQ(wire("55=AAPL|"), FieldEncoder::encode(FixFields::Symbol, std::string("AAPL")));
    EXPECT_EQ(wire("8=FIX.4.2|"), FieldEncoder::encode(FixFields::BeginString, std::string(FIX_VERSION_42)));
}

TEST(FieldEncoderTest, StringIsTrimmed)
{
    EXPECT_EQ(wire("49=CLIENT1|"), FieldEncoder::encode(FixFields::SenderCompID, std::string("  CLIENT1\t")));
    EXPECT_EQ(wire("55=BRK B|"), FieldEncoder::encode(FixFields::Symbol, std::string(" BRK B ")));
}

TEST(FieldEncoderTest, EmptyStringStillProducesField)
{
    EXPECT_EQ(wire("58=|"), FieldEncoder::encode(FixFields::Text, std::string("   ")));
}

TEST(FieldEncoderTest, EveryFieldEndsWithExactlyOneSoh)
{
    std::string field = FieldEncoder::encode(FixFields::Symbol, std::string("MSFT"));
    ASSERT_FALSE(field.empty());
    EXPECT_EQ(FIX_SOH, field.back());
    EXPECT_EQ(1, std::count(field.begin(), field.end(), FIX_SOH));
}

TEST(FieldEncoderTest, AppendFieldConcatenatesInOrder)
{
    std::string buffer;
    FieldEncoder::appendField(buffer, FixFields::Symbol, std::string("AAPL"));
    FieldEncoder::appendField(buffer, FixFields::Side, '2');
    FieldEncoder::appendField(buffer, FixFields::OrderQty, int64_t{10});

    EXPECT_EQ(wire("55=AAPL|54=2|38=10|"), buffer);
}

TEST(FieldEncoderTest, TrimHandlesEdgeCases)
{
    EXPECT_EQ("", FieldEncoder::trim(""));
    EXPECT_EQ("", FieldEncoder::trim(" \t\r\n"));
    EXPECT_EQ("a b", FieldEncoder::trim("  a b  "));
    EXPECT_EQ("x", FieldEncoder::trim("x"));
}
