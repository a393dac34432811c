#pragma once

#include "compression/huffman/logger.hpp"
#include "compression/huffman/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace huffpack::compression::huffman {

struct Node {
    std::uint64_t weight {0};
    int symbol {0};
    const Node* left {nullptr};
    const Node* right {nullptr};

    bool isLeaf() const noexcept { return left == nullptr && right == nullptr; }
};

// Owns every node of one tree. Children are non-owning pointers into the same storage.
class HuffmanTree {
public:
    HuffmanTree() = default;

    HuffmanTree(const HuffmanTree&) = delete;
    HuffmanTree& operator=(const HuffmanTree&) = delete;
    HuffmanTree(HuffmanTree&&) noexcept = default;
    HuffmanTree& operator=(HuffmanTree&&) noexcept = default;

    const Node* root() const noexcept { return root_; }
    std::size_t nodeCount() const noexcept { return storage_.size(); }
    std::size_t leafCount() const noexcept;

    const Node* addLeaf(int symbol, std::uint64_t weight);
    const Node* addInternal(const Node* left, const Node* right);
    void setRoot(const Node* root) noexcept { root_ = root; }

private:
    std::vector<std::unique_ptr<Node>> storage_;
    const Node* root_ {nullptr};
};

HuffmanTree buildTree(const FrequencyTable& frequencies, Logger& logger = nullLogger());

CodeTable buildCodeTable(const Node* root, Logger& logger = nullLogger());

std::string toString(const CodeTableEntry& entry);

} // namespace huffpack::compression::huffman
