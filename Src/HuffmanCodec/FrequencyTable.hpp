#pragma once
#ifndef HUFFCPP_FREQUENCY_TABLE_HPP
#define HUFFCPP_FREQUENCY_TABLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace huffcpp::algorithms
{
    using Symbol = uint8_t;

    constexpr size_t ALPHABET_SIZE = 256;

    class FrequencyTable
    {
      private:
        std::array<uint64_t, ALPHABET_SIZE> counts{};
        size_t distinctSymbols = 0;
        uint64_t total = 0;

      public:
        FrequencyTable() = default;

        static FrequencyTable count(const std::vector<uint8_t>& input);

        // entries must hold distinct symbols with non-zero counts
        static FrequencyTable fromEntries(const std::vector<std::pair<Symbol, uint64_t>>& entries);

        uint64_t frequency(Symbol symbol) const { return counts[symbol]; }
        bool contains(Symbol symbol) const { return counts[symbol] != 0; }

        size_t distinctCount() const { return distinctSymbols; }
        uint64_t totalCount() const { return total; }
        bool empty() const { return distinctSymbols == 0; }

        // present symbols in ascending order
        std::vector<std::pair<Symbol, uint64_t>> entries() const;

        bool operator==(const FrequencyTable& other) const { return counts == other.counts; }
        bool operator!=(const FrequencyTable& other) const { return !(*this == other); }
    };
}

#endif // HUFFCPP_FREQUENCY_TABLE_HPP
