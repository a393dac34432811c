#pragma once

#include "compression/huffman/bit_stream.hpp"
#include "compression/huffman/logger.hpp"
#include "compression/huffman/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace huffpack::compression::huffman {

TransferStats compress(BitInputStream& input, BitOutputStream& output, Logger& logger = nullLogger());
TransferStats decompress(BitInputStream& input, BitOutputStream& output, Logger& logger = nullLogger());

std::vector<std::uint8_t> compressBuffer(const std::vector<std::uint8_t>& input, Logger& logger = nullLogger());
std::vector<std::uint8_t> decompressBuffer(const std::vector<std::uint8_t>& input, Logger& logger = nullLogger());

TransferStats compressFile(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           Logger& logger = nullLogger());
TransferStats decompressFile(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             Logger& logger = nullLogger());

} // namespace huffpack::compression::huffman
