#pragma once

#include "compression/huffman/bit_stream.hpp"
#include "compression/huffman/logger.hpp"
#include "compression/huffman/tree.hpp"

namespace huffpack::compression::huffman {

void writeMagic(BitOutputStream& output);
void readMagic(BitInputStream& input);

void writeTreeHeader(const Node* root, BitOutputStream& output);
HuffmanTree readTreeHeader(BitInputStream& input, Logger& logger = nullLogger());

} // namespace huffpack::compression::huffman
