#include <gtest/gtest.h>
#include <string>
#include "../../Src/HuffmanCodec/FrequencyTable.hpp"
#include "helpers/unitTestHelpers.hpp"

using namespace huffcpp::algorithms;

TEST(FrequencyTableTest, Count_EmptyInput_IsEmpty)
{
    FrequencyTable table = FrequencyTable::count({});
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.distinctCount(), 0);
    EXPECT_EQ(table.totalCount(), 0);
    EXPECT_TRUE(table.entries().empty());
}

TEST(FrequencyTableTest, Count_MixedInput_CountsEverySymbol)
{
    FrequencyTable table = FrequencyTable::count(toBytes("aaaabbbccd"));

    EXPECT_EQ(table.distinctCount(), 4);
    EXPECT_EQ(table.totalCount(), 10);
    EXPECT_EQ(table.frequency('a'), 4);
    EXPECT_EQ(table.frequency('b'), 3);
    EXPECT_EQ(table.frequency('c'), 2);
    EXPECT_EQ(table.frequency('d'), 1);
    EXPECT_EQ(table.frequency('e'), 0);
    EXPECT_FALSE(table.contains('e'));
}

TEST(FrequencyTableTest, Entries_AreInAscendingSymbolOrder)
{
    FrequencyTable table = FrequencyTable::count(toBytes("dcba\xff"));
    auto entries = table.entries();

    ASSERT_EQ(entries.size(), 5);
    for (size_t i = 1; i < entries.size(); ++i)
    {
        EXPECT_LT(entries[i - 1].first, entries[i].first);
    }
}

TEST(FrequencyTableTest, Count_SingleDistinctSymbol)
{
    FrequencyTable table = FrequencyTable::count(toBytes("zzzz"));
    EXPECT_EQ(table.distinctCount(), 1);
    EXPECT_EQ(table.frequency('z'), 4);
}

TEST(FrequencyTableTest, Count_TotalEqualsInputLength)
{
    std::vector<uint8_t> input = genRandomBinaryInput(5000);
    FrequencyTable table = FrequencyTable::count(input);

    uint64_t sum = 0;
    for (const auto& [symbol, frequency] : table.entries())
    {
        EXPECT_GE(frequency, 1);
        sum += frequency;
    }
    EXPECT_EQ(sum, input.size());
    EXPECT_EQ(table.totalCount(), input.size());
}

TEST(FrequencyTableTest, FromEntries_MatchesCountedTable)
{
    FrequencyTable counted = FrequencyTable::count(toBytes("aaaabbbccd"));
    FrequencyTable rebuilt = FrequencyTable::fromEntries(counted.entries());

    EXPECT_EQ(counted, rebuilt);
    EXPECT_EQ(rebuilt.totalCount(), 10);
    EXPECT_EQ(rebuilt.distinctCount(), 4);
}

TEST(FrequencyTableTest, FromEntries_SkipsZeroCounts)
{
    FrequencyTable table = FrequencyTable::fromEntries({{'a', 0}, {'b', 2}});
    EXPECT_EQ(table.distinctCount(), 1);
    EXPECT_FALSE(table.contains('a'));
}
