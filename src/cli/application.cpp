#include "cli/application.hpp"

#include "compression/huffman.hpp"
#include "compression/huffman/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

namespace huffman = huffpack::compression::huffman;

enum class Command {
    Compress,
    Decompress,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
    huffman::DebugLevel debug {huffman::DebugLevel::Off};
    bool stats {false};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  huffpack help\n"
              << "  huffpack compress --input <path> --output <path> [--debug <0|1|4>] [--stats]\n"
              << "  huffpack decompress --input <path> --output <path> [--debug <0|1|4>] [--stats]\n\n"
              << "Notes:\n"
              << "  - Short forms: -i, -o, -d, -s, -h.\n"
              << "  - Debug output goes to stderr: 1 prints phase summaries, 4 adds every code and leaf.\n"
              << "  - --stats prints the number of bits read and written.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "compress") {
        return Command::Compress;
    }
    if (lowered == "decompress") {
        return Command::Decompress;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];

        if ((argument == "--input" || argument == "-i") && index + 1 < argc) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && index + 1 < argc) {
            options.output = std::filesystem::path(argv[++index]);
        } else if ((argument == "--debug" || argument == "-d") && index + 1 < argc) {
            options.debug = huffman::parseDebugLevel(argv[++index]);
        } else if (argument == "--stats" || argument == "-s") {
            options.stats = true;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Missing required --input argument");
    }
    if (options.output.empty()) {
        throw std::invalid_argument("Missing required --output argument");
    }
    return options;
}

void requireInputFile(const std::filesystem::path& input)
{
    if (!std::filesystem::exists(input)) {
        throw std::runtime_error("Input path does not exist: " + input.string());
    }
    if (std::filesystem::is_directory(input)) {
        throw std::runtime_error("Input must be a file, not a directory: " + input.string());
    }
}

void printStats(const huffman::TransferStats& stats)
{
    std::cout << "bits read: " << stats.bitsRead << "\n"
              << "bits written: " << stats.bitsWritten << "\n";
}

} // namespace

namespace huffpack::cli {

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);

        if (options.command == Command::Help) {
            printUsage();
            return 0;
        }

        requireInputFile(options.input);
        huffman::StreamLogger logger(std::cerr, options.debug);

        if (options.command == Command::Compress) {
            const auto stats = huffman::compressFile(options.input, options.output, logger);
            if (options.stats) {
                printStats(stats);
            }
            std::cout << "Compression completed successfully\n";
            return 0;
        }

        if (options.command == Command::Decompress) {
            const auto stats = huffman::decompressFile(options.input, options.output, logger);
            if (options.stats) {
                printStats(stats);
            }
            std::cout << "Decompression completed successfully\n";
            return 0;
        }

        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace huffpack::cli
