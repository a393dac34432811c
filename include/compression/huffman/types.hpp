#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace huffpack::compression::huffman {

inline constexpr int kBitsPerWord = 8;
inline constexpr int kBitsPerSymbol = kBitsPerWord + 1;
inline constexpr int kBitsPerInt = 32;
inline constexpr int kAlphabetSize = (1 << kBitsPerWord) + 1;
inline constexpr int kPseudoEof = 1 << kBitsPerWord;

inline constexpr std::uint32_t kHuffNumber = 0xface8200U;
inline constexpr std::uint32_t kHuffTree = kHuffNumber | 1U;

using FrequencyTable = std::array<std::uint32_t, kAlphabetSize>;

struct CodeTableEntry {
    std::vector<bool> bits;
};

using CodeTable = std::array<CodeTableEntry, kAlphabetSize>;

struct TransferStats {
    std::uint64_t bitsRead {0};
    std::uint64_t bitsWritten {0};
};

} // namespace huffpack::compression::huffman
