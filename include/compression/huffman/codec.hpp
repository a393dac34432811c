#pragma once

#include "compression/huffman/bit_stream.hpp"
#include "compression/huffman/logger.hpp"
#include "compression/huffman/tree.hpp"
#include "compression/huffman/types.hpp"

namespace huffpack::compression::huffman {

FrequencyTable countFrequencies(BitInputStream& input);

void encodeStream(const CodeTable& codes, BitInputStream& input, BitOutputStream& output);
void decodeStream(const Node* root, BitInputStream& input, BitOutputStream& output, Logger& logger = nullLogger());

} // namespace huffpack::compression::huffman
