#include "compression/huffman/codec.hpp"

#include "compression/huffman/errors.hpp"

#include <stdexcept>
#include <string>

namespace huffpack::compression::huffman {
namespace {

enum class DecodeStatus {
    Symbol,
    EndOfStream,
    Truncated
};

// Walks from the root to the next leaf. A leaf root consumes one bit per symbol.
DecodeStatus decodeSymbol(const Node* root, BitInputStream& input, int& symbol)
{
    const Node* current = root;
    do {
        bool bit = false;
        if (!input.readBit(bit)) {
            return DecodeStatus::Truncated;
        }
        if (!current->isLeaf()) {
            current = bit ? current->right : current->left;
        }
    } while (!current->isLeaf());

    symbol = current->symbol;
    return symbol == kPseudoEof ? DecodeStatus::EndOfStream : DecodeStatus::Symbol;
}

} // namespace

FrequencyTable countFrequencies(BitInputStream& input)
{
    FrequencyTable frequencies {};
    std::uint32_t value = 0;
    while (input.readBits(kBitsPerWord, value)) {
        ++frequencies[static_cast<std::size_t>(value)];
    }
    frequencies[kPseudoEof] = 1;
    return frequencies;
}

void encodeStream(const CodeTable& codes, BitInputStream& input, BitOutputStream& output)
{
    std::uint32_t value = 0;
    while (input.readBits(kBitsPerWord, value)) {
        const auto& bits = codes[static_cast<std::size_t>(value)].bits;
        if (bits.empty()) {
            throw std::runtime_error("Invalid Huffman code table entry for byte " + std::to_string(value));
        }
        output.writeCode(bits);
    }

    const auto& eof = codes[kPseudoEof].bits;
    if (eof.empty()) {
        throw std::runtime_error("Huffman code table has no pseudo-EOF entry");
    }
    output.writeCode(eof);
    output.close();
}

void decodeStream(const Node* root, BitInputStream& input, BitOutputStream& output, Logger& logger)
{
    if (!root) {
        throw std::invalid_argument("Cannot decode without a Huffman tree");
    }

    std::uint64_t decoded = 0;
    while (true) {
        int symbol = 0;
        const auto status = decodeSymbol(root, input, symbol);
        if (status == DecodeStatus::Truncated) {
            throw TruncatedStreamError("Bad input, no PSEUDO_EOF after " + std::to_string(decoded) + " symbols");
        }
        if (status == DecodeStatus::EndOfStream) {
            break;
        }
        output.writeBits(kBitsPerWord, static_cast<std::uint32_t>(symbol));
        ++decoded;
    }

    logger.log(DebugLevel::Low, "decoded " + std::to_string(decoded) + " bytes");
    output.close();
}

} // namespace huffpack::compression::huffman
