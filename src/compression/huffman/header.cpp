#include "compression/huffman/header.hpp"

#include "compression/huffman/errors.hpp"
#include "compression/huffman/types.hpp"

#include <sstream>
#include <string>

namespace huffpack::compression::huffman {
namespace {

// A tree over 257 leaves can never be deeper than this.
constexpr int kMaxTreeDepth = kAlphabetSize - 1;

std::string toHex(std::uint32_t value)
{
    std::ostringstream stream;
    stream << "0x" << std::hex << value;
    return stream.str();
}

const Node* readNode(BitInputStream& input, HuffmanTree& tree, int depth, Logger& logger)
{
    if (depth > kMaxTreeDepth) {
        throw CorruptHeaderError("Huffman tree header nests deeper than " + std::to_string(kMaxTreeDepth) + " levels");
    }

    bool bit = false;
    if (!input.readBit(bit)) {
        throw CorruptHeaderError("Huffman tree header ended unexpectedly");
    }

    if (!bit) {
        const Node* left = readNode(input, tree, depth + 1, logger);
        const Node* right = readNode(input, tree, depth + 1, logger);
        return tree.addInternal(left, right);
    }

    std::uint32_t symbol = 0;
    if (!input.readBits(kBitsPerSymbol, symbol)) {
        throw CorruptHeaderError("Huffman tree header ended inside a leaf symbol");
    }
    if (symbol > static_cast<std::uint32_t>(kPseudoEof)) {
        throw CorruptHeaderError("Huffman tree header holds invalid symbol " + std::to_string(symbol));
    }

    if (logger.enabled(DebugLevel::High)) {
        logger.write(DebugLevel::High,
                     "leaf " + std::to_string(symbol) + " at depth " + std::to_string(depth));
    }
    return tree.addLeaf(static_cast<int>(symbol), 0);
}

} // namespace

void writeMagic(BitOutputStream& output)
{
    output.writeBits(kBitsPerInt, kHuffTree);
}

void readMagic(BitInputStream& input)
{
    std::uint32_t magic = 0;
    if (!input.readBits(kBitsPerInt, magic)) {
        throw FormatError("Input is too short to hold the Huffman preamble");
    }
    if (magic != kHuffTree) {
        throw FormatError("Illegal header starts with " + toHex(magic), magic);
    }
}

void writeTreeHeader(const Node* root, BitOutputStream& output)
{
    if (root->isLeaf()) {
        output.writeBit(true);
        output.writeBits(kBitsPerSymbol, static_cast<std::uint32_t>(root->symbol));
        return;
    }

    output.writeBit(false);
    writeTreeHeader(root->left, output);
    writeTreeHeader(root->right, output);
}

HuffmanTree readTreeHeader(BitInputStream& input, Logger& logger)
{
    HuffmanTree tree;
    const auto start = input.bitsRead();
    tree.setRoot(readNode(input, tree, 0, logger));
    logger.log(DebugLevel::Low,
               "parsed tree header: " + std::to_string(tree.leafCount()) + " leaves, "
                   + std::to_string(input.bitsRead() - start) + " bits");
    return tree;
}

} // namespace huffpack::compression::huffman
