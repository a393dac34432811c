#include "compression/huffman.hpp"

#include "compression/huffman/codec.hpp"
#include "compression/huffman/header.hpp"
#include "compression/huffman/tree.hpp"
#include "utils/file_io.hpp"

#include <string>
#include <utility>

namespace huffpack::compression::huffman {
namespace {

std::size_t countDistinct(const FrequencyTable& frequencies)
{
    std::size_t distinct = 0;
    for (auto frequency : frequencies) {
        if (frequency != 0U) {
            ++distinct;
        }
    }
    return distinct;
}

void logTransfer(Logger& logger, const char* operation, const TransferStats& stats)
{
    logger.log(DebugLevel::Low,
               std::string(operation) + ": " + std::to_string(stats.bitsRead) + " bits read, "
                   + std::to_string(stats.bitsWritten) + " bits written");
}

} // namespace

TransferStats compress(BitInputStream& input, BitOutputStream& output, Logger& logger)
{
    const auto frequencies = countFrequencies(input);
    logger.log(DebugLevel::Low, "counted " + std::to_string(countDistinct(frequencies)) + " distinct symbols");

    const auto tree = buildTree(frequencies, logger);
    const auto codes = buildCodeTable(tree.root(), logger);

    writeMagic(output);
    const auto headerStart = output.bitsWritten();
    writeTreeHeader(tree.root(), output);
    logger.log(DebugLevel::Low, "tree header uses " + std::to_string(output.bitsWritten() - headerStart) + " bits");

    input.reset();
    encodeStream(codes, input, output);

    const TransferStats stats {input.bitsRead(), output.bitsWritten()};
    logTransfer(logger, "compress", stats);
    return stats;
}

TransferStats decompress(BitInputStream& input, BitOutputStream& output, Logger& logger)
{
    readMagic(input);
    const auto tree = readTreeHeader(input, logger);
    decodeStream(tree.root(), input, output, logger);

    const TransferStats stats {input.bitsRead(), output.bitsWritten()};
    logTransfer(logger, "decompress", stats);
    return stats;
}

std::vector<std::uint8_t> compressBuffer(const std::vector<std::uint8_t>& input, Logger& logger)
{
    BitInputStream reader(input);
    BitOutputStream writer;
    compress(reader, writer, logger);
    return writer.bytes();
}

std::vector<std::uint8_t> decompressBuffer(const std::vector<std::uint8_t>& input, Logger& logger)
{
    BitInputStream reader(input);
    BitOutputStream writer;
    decompress(reader, writer, logger);
    return writer.bytes();
}

TransferStats compressFile(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           Logger& logger)
{
    BitInputStream reader(utils::readFileBytes(source));
    BitOutputStream writer;
    const auto stats = compress(reader, writer, logger);
    utils::writeBufferToFile(destination, writer.bytes());
    return stats;
}

TransferStats decompressFile(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             Logger& logger)
{
    BitInputStream reader(utils::readFileBytes(source));
    BitOutputStream writer;
    const auto stats = decompress(reader, writer, logger);
    utils::writeBufferToFile(destination, writer.bytes());
    return stats;
}

} // namespace huffpack::compression::huffman
