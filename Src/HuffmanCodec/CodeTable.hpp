#pragma once
#ifndef HUFFCPP_CODE_TABLE_HPP
#define HUFFCPP_CODE_TABLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/dynamic_bitset.hpp>
#include "FrequencyTable.hpp"
#include "HuffmanTree.hpp"

namespace huffcpp::algorithms
{
    // bit i of a code is the i-th bit emitted, i.e. the i-th edge from the root
    using Code = boost::dynamic_bitset<>;

    class CodeTable
    {
      private:
        std::array<Code, ALPHABET_SIZE> codes;

        void assignCodes(const HuffmanTree& tree, int32_t index, Code& prefix);

      public:
        CodeTable() = default;

        static CodeTable fromTree(const HuffmanTree& tree);

        bool contains(Symbol symbol) const { return !codes[symbol].empty(); }
        const Code& code(Symbol symbol) const { return codes[symbol]; }
        size_t codeLength(Symbol symbol) const { return codes[symbol].size(); }

        std::vector<Symbol> symbols() const;

        // sum of frequency x code length, i.e. the payload size in bits
        uint64_t weightedLength(const FrequencyTable& table) const;
    };

    // "0"/"1" rendering of a code, first emitted bit first
    std::string codeToString(const Code& code);
}

#endif // HUFFCPP_CODE_TABLE_HPP
