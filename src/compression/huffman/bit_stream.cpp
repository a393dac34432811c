#include "compression/huffman/bit_stream.hpp"

#include <stdexcept>
#include <utility>

namespace huffpack::compression::huffman {

BitInputStream::BitInputStream(std::vector<std::uint8_t> data)
    : data_(std::move(data))
{
}

bool BitInputStream::readBit(bool& bit)
{
    if (byteIndex_ >= data_.size()) {
        return false;
    }
    bit = takeBit();
    return true;
}

bool BitInputStream::readBits(int count, std::uint32_t& value)
{
    if (count < 0 || count > 32) {
        throw std::invalid_argument("Bit count must be between 0 and 32");
    }
    if (remainingBits() < static_cast<std::size_t>(count)) {
        return false;
    }

    std::uint32_t result = 0;
    for (int index = 0; index < count; ++index) {
        result = (result << 1U) | static_cast<std::uint32_t>(takeBit());
    }
    value = result;
    return true;
}

bool BitInputStream::takeBit() noexcept
{
    const auto current = data_[byteIndex_];
    const bool bit = static_cast<bool>((current >> (7U - bitIndex_)) & 0x1U);
    ++bitIndex_;
    ++bitsRead_;
    if (bitIndex_ == 8U) {
        bitIndex_ = 0;
        ++byteIndex_;
    }
    return bit;
}

void BitInputStream::reset() noexcept
{
    byteIndex_ = 0;
    bitIndex_ = 0;
}

std::size_t BitInputStream::remainingBits() const noexcept
{
    if (byteIndex_ >= data_.size()) {
        return 0;
    }
    return (data_.size() - byteIndex_) * 8U - bitIndex_;
}

void BitOutputStream::writeBit(bool bit)
{
    if (closed_) {
        throw std::logic_error("Write to a closed bit stream");
    }

    current_ = static_cast<std::uint8_t>((current_ << 1U) | static_cast<std::uint8_t>(bit));
    ++bitCount_;
    ++bitsWritten_;
    if (bitCount_ == 8U) {
        buffer_.push_back(current_);
        current_ = 0;
        bitCount_ = 0;
    }
}

void BitOutputStream::writeBits(int count, std::uint32_t value)
{
    if (count < 0 || count > 32) {
        throw std::invalid_argument("Bit count must be between 0 and 32");
    }
    for (int shift = count - 1; shift >= 0; --shift) {
        writeBit(((value >> static_cast<unsigned>(shift)) & 0x1U) != 0U);
    }
}

void BitOutputStream::writeCode(const std::vector<bool>& bits)
{
    for (bool bit : bits) {
        writeBit(bit);
    }
}

void BitOutputStream::close()
{
    if (closed_) {
        return;
    }
    if (bitCount_ > 0U) {
        current_ <<= (8U - bitCount_);
        buffer_.push_back(current_);
        current_ = 0;
        bitCount_ = 0;
    }
    closed_ = true;
}

} // namespace huffpack::compression::huffman
