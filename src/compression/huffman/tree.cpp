#include "compression/huffman/tree.hpp"

#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

namespace huffpack::compression::huffman {
namespace {

struct QueueEntry {
    const Node* node {nullptr};
    std::uint64_t sequence {0};
};

// Min-heap on weight; equal weights leave in insertion order.
struct QueueEntryComparator {
    bool operator()(const QueueEntry& lhs, const QueueEntry& rhs) const noexcept
    {
        if (lhs.node->weight == rhs.node->weight) {
            return lhs.sequence > rhs.sequence;
        }
        return lhs.node->weight > rhs.node->weight;
    }
};

void collectCodes(const Node* node, std::vector<bool>& prefix, CodeTable& table, Logger& logger)
{
    if (node->isLeaf()) {
        auto& entry = table[static_cast<std::size_t>(node->symbol)];
        if (prefix.empty()) {
            entry.bits.push_back(false);
        } else {
            entry.bits = prefix;
        }
        if (logger.enabled(DebugLevel::High)) {
            logger.write(DebugLevel::High,
                         "code " + std::to_string(node->symbol) + " = " + toString(entry));
        }
        return;
    }

    prefix.push_back(false);
    collectCodes(node->left, prefix, table, logger);
    prefix.back() = true;
    collectCodes(node->right, prefix, table, logger);
    prefix.pop_back();
}

} // namespace

std::size_t HuffmanTree::leafCount() const noexcept
{
    std::size_t count = 0;
    for (const auto& node : storage_) {
        if (node->isLeaf()) {
            ++count;
        }
    }
    return count;
}

const Node* HuffmanTree::addLeaf(int symbol, std::uint64_t weight)
{
    storage_.emplace_back(std::make_unique<Node>(Node {weight, symbol, nullptr, nullptr}));
    return storage_.back().get();
}

const Node* HuffmanTree::addInternal(const Node* left, const Node* right)
{
    if (!left || !right) {
        throw std::invalid_argument("Internal Huffman node requires two children");
    }
    storage_.emplace_back(std::make_unique<Node>(Node {left->weight + right->weight, 0, left, right}));
    return storage_.back().get();
}

HuffmanTree buildTree(const FrequencyTable& frequencies, Logger& logger)
{
    HuffmanTree tree;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueEntryComparator> queue;
    std::uint64_t sequence = 0;

    for (std::size_t symbol = 0; symbol < frequencies.size(); ++symbol) {
        if (frequencies[symbol] == 0U) {
            continue;
        }
        queue.push(QueueEntry {tree.addLeaf(static_cast<int>(symbol), frequencies[symbol]), sequence++});
    }

    if (queue.empty()) {
        throw std::invalid_argument("Cannot build a Huffman tree from an empty frequency table");
    }

    logger.log(DebugLevel::Low, "building tree from " + std::to_string(queue.size()) + " symbols");

    while (queue.size() > 1U) {
        const Node* left = queue.top().node;
        queue.pop();
        const Node* right = queue.top().node;
        queue.pop();

        queue.push(QueueEntry {tree.addInternal(left, right), sequence++});
    }

    tree.setRoot(queue.top().node);
    return tree;
}

CodeTable buildCodeTable(const Node* root, Logger& logger)
{
    CodeTable table;
    if (!root) {
        return table;
    }

    std::vector<bool> prefix;
    collectCodes(root, prefix, table, logger);
    return table;
}

std::string toString(const CodeTableEntry& entry)
{
    std::string text;
    text.reserve(entry.bits.size());
    for (bool bit : entry.bits) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

} // namespace huffpack::compression::huffman
