#include <gtest/gtest.h>
#include <string>
#include "../../Src/Container/Container.hpp"
#include "helpers/unitTestHelpers.hpp"

using namespace huffcpp::algorithms;
using namespace huffcpp::container;

const std::vector<uint8_t> MockContainer = {
    0x00, 0x00, 0x00, 0x04,
    'a', 0x00, 0x00, 0x00, 0x04,
    'b', 0x00, 0x00, 0x00, 0x03,
    'c', 0x00, 0x00, 0x00, 0x02,
    'd', 0x00, 0x00, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x13,
    0x0A, 0xBF, 0xC0
};

static EncodedPayload mockPayload()
{
    EncodedPayload payload;
    payload.bytes = {0x0A, 0xBF, 0xC0};
    payload.validBitCount = 19;
    return payload;
}

TEST(ContainerTest, Serialize_WritesBigEndianLayout)
{
    FrequencyTable table = FrequencyTable::count(toBytes("aaaabbbccd"));
    Result<std::vector<uint8_t>> serialized = Container::serialize(table, mockPayload());

    ASSERT_TRUE(serialized.success());
    EXPECT_EQ(serialized.getValue().size(), 35);
    EXPECT_EQ(serialized.getValue(), MockContainer);
}

TEST(ContainerTest, Serialize_SingleSymbol)
{
    FrequencyTable table = FrequencyTable::count(toBytes("zzzz"));
    EncodedPayload payload;
    payload.bytes = {0x00};
    payload.validBitCount = 4;

    Result<std::vector<uint8_t>> serialized = Container::serialize(table, payload);
    ASSERT_TRUE(serialized.success());

    std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x01,
        'z', 0x00, 0x00, 0x00, 0x04,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04,
        0x00
    };
    EXPECT_EQ(serialized.getValue(), expected);
}

TEST(ContainerTest, Serialize_EmptyTable_WritesTwelveZeroBytes)
{
    Result<std::vector<uint8_t>> serialized = Container::serialize(FrequencyTable(), EncodedPayload());
    ASSERT_TRUE(serialized.success());
    EXPECT_EQ(serialized.getValue(), std::vector<uint8_t>(12, 0x00));
}

TEST(ContainerTest, Serialize_PayloadSizeMismatch_ReturnsInvalidInput)
{
    FrequencyTable table = FrequencyTable::count(toBytes("aaaabbbccd"));
    EncodedPayload payload = mockPayload();
    payload.validBitCount = 25;

    Result<std::vector<uint8_t>> serialized = Container::serialize(table, payload);
    ASSERT_FALSE(serialized.success());
    EXPECT_EQ(serialized.getErrorCode(), ErrorCode::INVALID_INPUT);
}

TEST(ContainerTest, Serialize_FrequencyAbove32Bits_ReturnsInvalidInput)
{
    FrequencyTable table = FrequencyTable::fromEntries({{'a', MAX_FREQUENCY + 1}});
    Result<std::vector<uint8_t>> serialized = Container::serialize(table, EncodedPayload());
    ASSERT_FALSE(serialized.success());
    EXPECT_EQ(serialized.getErrorCode(), ErrorCode::INVALID_INPUT);
}

TEST(ContainerTest, Parse_ReadsBackHeaderAndPayload)
{
    Result<ContainerView> parsed = Container::parse(MockContainer);
    ASSERT_TRUE(parsed.success());

    const ContainerView& view = parsed.getValue();
    EXPECT_EQ(view.frequencyTable, FrequencyTable::count(toBytes("aaaabbbccd")));
    EXPECT_EQ(view.validBitCount, 19);
    std::vector<uint8_t> expectedPayload = {0x0A, 0xBF, 0xC0};
    EXPECT_EQ(view.payload, expectedPayload);
}

TEST(ContainerTest, Parse_EmptyContainer)
{
    Result<ContainerView> parsed = Container::parse(std::vector<uint8_t>(12, 0x00));
    ASSERT_TRUE(parsed.success());
    EXPECT_TRUE(parsed.getValue().frequencyTable.empty());
    EXPECT_EQ(parsed.getValue().validBitCount, 0);
    EXPECT_TRUE(parsed.getValue().payload.empty());
}

TEST(ContainerTest, HeaderSize_MatchesLayout)
{
    EXPECT_EQ(Container::headerSize(0), 12);
    EXPECT_EQ(Container::headerSize(4), 32);
    EXPECT_EQ(Container::headerSize(256), 4 + 256 * 5 + 8);
}

class ContainerMalformedTest : public ::testing::Test {
protected:
    std::vector<uint8_t> container;

    void SetUp() override {
        container = MockContainer;
    }

    void expectMalformed() {
        Result<ContainerView> parsed = Container::parse(container);
        ASSERT_FALSE(parsed.success());
        EXPECT_EQ(parsed.getErrorCode(), ErrorCode::MALFORMED_CONTAINER) << parsed.getError();
    }
};

TEST_F(ContainerMalformedTest, TooShortForSymbolCount)
{
    container = {0x00, 0x00};
    expectMalformed();
}

TEST_F(ContainerMalformedTest, SymbolCountAboveAlphabet)
{
    container[2] = 0x01;
    container[3] = 0x01;
    expectMalformed();
}

TEST_F(ContainerMalformedTest, TruncatedHeader)
{
    container.resize(20);
    expectMalformed();
}

TEST_F(ContainerMalformedTest, ZeroFrequency)
{
    container[5] = 0x00;
    container[6] = 0x00;
    container[7] = 0x00;
    container[8] = 0x00;
    expectMalformed();
}

TEST_F(ContainerMalformedTest, SymbolsOutOfOrder)
{
    container[9] = 'a';
    expectMalformed();
}

TEST_F(ContainerMalformedTest, NoSymbolsButPayloadBits)
{
    container = std::vector<uint8_t>(12, 0x00);
    container[11] = 0x08;
    container.push_back(0x00);
    expectMalformed();
}

TEST_F(ContainerMalformedTest, ValidBitsExceedPayload)
{
    container.pop_back();
    expectMalformed();
}

TEST_F(ContainerMalformedTest, TrailingBytes)
{
    container.push_back(0x00);
    expectMalformed();
}
