#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace huffpack::compression::huffman {

class HuffmanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or unexpected 32-bit preamble.
class FormatError : public HuffmanError {
public:
    explicit FormatError(const std::string& message, std::optional<std::uint32_t> found = std::nullopt);

    const std::optional<std::uint32_t>& found() const noexcept { return found_; }

private:
    std::optional<std::uint32_t> found_;
};

class CorruptHeaderError : public HuffmanError {
public:
    using HuffmanError::HuffmanError;
};

// Body ended before the pseudo-EOF code.
class TruncatedStreamError : public HuffmanError {
public:
    using HuffmanError::HuffmanError;
};

} // namespace huffpack::compression::huffman
