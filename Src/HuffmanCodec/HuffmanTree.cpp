#include "HuffmanTree.hpp"
#include <queue>
#include <vector>

namespace
{
    struct HeapEntry
    {
        uint64_t frequency;
        int32_t sequence;   // arena index, doubles as the tie-break key
    };

    struct Compare
    {
        bool operator()(const HeapEntry& l, const HeapEntry& r) const
        {
            if (l.frequency != r.frequency) return l.frequency > r.frequency;
            return l.sequence > r.sequence;
        }
    };
}

Result<huffcpp::algorithms::HuffmanTree> huffcpp::algorithms::TreeBuilder::build(
    const FrequencyTable& table
) {
    if (table.empty()) {
        return makeError<HuffmanTree>(
            ErrorCode::INVALID_INPUT,
            "Cannot build a Huffman tree from an empty frequency table");
    }

    const auto entries = table.entries();
    std::vector<HuffmanNode> nodes;
    nodes.reserve(entries.size() * 2);

    for (const auto& [symbol, frequency] : entries)
    {
        HuffmanNode leaf;
        leaf.frequency = frequency;
        leaf.symbol = symbol;
        nodes.push_back(leaf);
    }

    if (nodes.size() == 1)
    {
        HuffmanNode root;
        root.frequency = nodes[0].frequency;
        root.left = 0;
        nodes.push_back(root);
        return makeResult<HuffmanTree>(HuffmanTree(std::move(nodes), 1));
    }

    std::priority_queue<HeapEntry, std::vector<HeapEntry>, Compare> heap;
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        heap.push({nodes[i].frequency, static_cast<int32_t>(i)});
    }

    while (heap.size() > 1)
    {
        HeapEntry left = heap.top();
        heap.pop();

        HeapEntry right = heap.top();
        heap.pop();

        HuffmanNode parent;
        parent.frequency = left.frequency + right.frequency;
        parent.left = left.sequence;
        parent.right = right.sequence;

        int32_t index = static_cast<int32_t>(nodes.size());
        nodes.push_back(parent);
        heap.push({parent.frequency, index});
    }

    int32_t rootIndex = heap.top().sequence;
    return makeResult<HuffmanTree>(HuffmanTree(std::move(nodes), rootIndex));
}
