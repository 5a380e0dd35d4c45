#include "CodeTable.hpp"
#include <initializer_list>
#include <string>

using huffcpp::algorithms::CodeTable;

void huffcpp::algorithms::CodeTable::assignCodes(
    const HuffmanTree& tree,
    int32_t index,
    Code& prefix
) {
    const HuffmanNode& current = tree.node(index);
    if (current.isLeaf())
    {
        codes[current.symbol] = prefix;
        return;
    }

    for (Direction direction : {Direction::LEFT, Direction::RIGHT})
    {
        int32_t next = tree.child(index, direction);
        if (next == NO_CHILD) continue;

        prefix.push_back(bitForDirection(direction));
        assignCodes(tree, next, prefix);
        prefix.pop_back();
    }
}

CodeTable huffcpp::algorithms::CodeTable::fromTree(const HuffmanTree& tree)
{
    CodeTable table;
    if (tree.empty()) {
        return table;
    }

    // a bare leaf root never comes out of TreeBuilder; give it the 1-bit code anyway
    if (tree.node(tree.root()).isLeaf())
    {
        Code single;
        single.push_back(bitForDirection(Direction::LEFT));
        table.codes[tree.node(tree.root()).symbol] = single;
        return table;
    }

    Code prefix;
    table.assignCodes(tree, tree.root(), prefix);
    return table;
}

std::vector<huffcpp::algorithms::Symbol> huffcpp::algorithms::CodeTable::symbols() const
{
    std::vector<Symbol> result;
    for (size_t symbol = 0; symbol < ALPHABET_SIZE; ++symbol)
    {
        if (!codes[symbol].empty()) {
            result.push_back(static_cast<Symbol>(symbol));
        }
    }
    return result;
}

uint64_t huffcpp::algorithms::CodeTable::weightedLength(const FrequencyTable& table) const
{
    uint64_t bits = 0;
    for (const auto& [symbol, frequency] : table.entries())
    {
        bits += frequency * codes[symbol].size();
    }
    return bits;
}

std::string huffcpp::algorithms::codeToString(const Code& code)
{
    std::string result;
    result.reserve(code.size());
    for (size_t i = 0; i < code.size(); ++i)
    {
        result.push_back(code[i] ? '1' : '0');
    }
    return result;
}
