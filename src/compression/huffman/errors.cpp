#include "compression/huffman/errors.hpp"

#include <utility>

namespace huffpack::compression::huffman {

FormatError::FormatError(const std::string& message, std::optional<std::uint32_t> found)
    : HuffmanError(message)
    , found_(std::move(found))
{
}

} // namespace huffpack::compression::huffman
