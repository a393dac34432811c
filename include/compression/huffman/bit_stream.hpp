#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace huffpack::compression::huffman {

// MSB-first bit reader over an owned byte buffer.
class BitInputStream {
public:
    explicit BitInputStream(std::vector<std::uint8_t> data);

    // Both return false, consuming nothing, when fewer than the requested bits remain.
    bool readBit(bool& bit);
    bool readBits(int count, std::uint32_t& value);

    void reset() noexcept;

    std::size_t remainingBits() const noexcept;
    std::uint64_t bitsRead() const noexcept { return bitsRead_; }

private:
    bool takeBit() noexcept;

    std::vector<std::uint8_t> data_;
    std::size_t byteIndex_ {0};
    std::uint8_t bitIndex_ {0};
    std::uint64_t bitsRead_ {0};
};

class BitOutputStream {
public:
    BitOutputStream() = default;

    void writeBit(bool bit);
    void writeBits(int count, std::uint32_t value);
    void writeCode(const std::vector<bool>& bits);

    // Pads the final partial byte with zero bits. Further writes throw.
    void close();

    bool closed() const noexcept { return closed_; }
    const std::vector<std::uint8_t>& bytes() const noexcept { return buffer_; }
    std::uint64_t bitsWritten() const noexcept { return bitsWritten_; }

private:
    std::vector<std::uint8_t> buffer_;
    std::uint8_t current_ {0};
    std::uint8_t bitCount_ {0};
    std::uint64_t bitsWritten_ {0};
    bool closed_ {false};
};

} // namespace huffpack::compression::huffman
