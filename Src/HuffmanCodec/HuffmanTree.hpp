#pragma once
#ifndef HUFFCPP_HUFFMAN_TREE_HPP
#define HUFFCPP_HUFFMAN_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "FrequencyTable.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    constexpr int32_t NO_CHILD = -1;

    // Edge convention shared by code generation and decoding: bit 0 goes left, bit 1 goes right.
    enum class Direction : uint8_t
    {
        LEFT = 0,
        RIGHT = 1
    };

    inline Direction directionForBit(bool bit)
    {
        return bit ? Direction::RIGHT : Direction::LEFT;
    }

    inline bool bitForDirection(Direction direction)
    {
        return direction == Direction::RIGHT;
    }

    struct HuffmanNode
    {
        uint64_t frequency = 0;
        Symbol symbol = 0;          // meaningful for leaves only
        int32_t left = NO_CHILD;
        int32_t right = NO_CHILD;

        bool isLeaf() const
        {
            return left == NO_CHILD && right == NO_CHILD;
        }
    };

    /* Arena of nodes; children are indices into the arena. */
    class HuffmanTree
    {
      private:
        std::vector<HuffmanNode> nodes;
        int32_t rootIndex = NO_CHILD;

      public:
        HuffmanTree() = default;
        HuffmanTree(std::vector<HuffmanNode> nodes, int32_t rootIndex)
            : nodes(std::move(nodes))
            , rootIndex(rootIndex)
        {}

        bool empty() const { return rootIndex == NO_CHILD; }
        int32_t root() const { return rootIndex; }
        size_t size() const { return nodes.size(); }

        const HuffmanNode& node(int32_t index) const { return nodes[static_cast<size_t>(index)]; }

        // NO_CHILD when the index is out of range or the child is absent
        int32_t child(int32_t index, Direction direction) const
        {
            if (index < 0 || static_cast<size_t>(index) >= nodes.size()) {
                return NO_CHILD;
            }
            const HuffmanNode& current = nodes[static_cast<size_t>(index)];
            int32_t next = direction == Direction::LEFT ? current.left : current.right;
            if (next < 0 || static_cast<size_t>(next) >= nodes.size()) {
                return NO_CHILD;
            }
            return next;
        }

        const std::vector<HuffmanNode>& getNodes() const { return nodes; }
    };

    struct TreeBuilder
    {
        /*
         * Greedy Huffman construction over a min-heap keyed on (frequency, sequence).
         * Leaves take sequence numbers 0..k-1 in ascending symbol order and every merged
         * node takes the next number when created, so equal frequencies resolve to the
         * older node first. The first node removed becomes the left child.
         * A single-symbol table yields a root whose only child is the left leaf.
         */
        static Result<HuffmanTree> build(const FrequencyTable& table);
    };
}

#endif // HUFFCPP_HUFFMAN_TREE_HPP
