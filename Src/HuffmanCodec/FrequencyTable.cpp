#include "FrequencyTable.hpp"

using huffcpp::algorithms::FrequencyTable;

FrequencyTable huffcpp::algorithms::FrequencyTable::count(const std::vector<uint8_t>& input)
{
    FrequencyTable table;
    for (uint8_t symbol : input)
    {
        if (table.counts[symbol]++ == 0) {
            ++table.distinctSymbols;
        }
    }
    table.total = input.size();
    return table;
}

FrequencyTable huffcpp::algorithms::FrequencyTable::fromEntries(
    const std::vector<std::pair<Symbol, uint64_t>>& entries
) {
    FrequencyTable table;
    for (const auto& [symbol, frequency] : entries)
    {
        if (frequency == 0) continue;
        if (table.counts[symbol] == 0) {
            ++table.distinctSymbols;
        }
        table.counts[symbol] += frequency;
        table.total += frequency;
    }
    return table;
}

std::vector<std::pair<huffcpp::algorithms::Symbol, uint64_t>>
huffcpp::algorithms::FrequencyTable::entries() const
{
    std::vector<std::pair<Symbol, uint64_t>> result;
    result.reserve(distinctSymbols);
    for (size_t symbol = 0; symbol < ALPHABET_SIZE; ++symbol)
    {
        if (counts[symbol] != 0) {
            result.emplace_back(static_cast<Symbol>(symbol), counts[symbol]);
        }
    }
    return result;
}
