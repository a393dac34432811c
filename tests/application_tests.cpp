#include "cli/application.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix)
    {
        const auto unique = prefix + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

int runCli(std::vector<std::string> arguments)
{
    arguments.insert(arguments.begin(), "huffpack");
    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);
    return huffpack::cli::run(static_cast<int>(arguments.size()), argv.data());
}

void writeBinaryFile(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string readBinaryFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

TEST(ApplicationTest, HelpSucceeds)
{
    EXPECT_EQ(runCli({}), 0);
    EXPECT_EQ(runCli({"help"}), 0);
    EXPECT_EQ(runCli({"compress", "--help"}), 0);
}

TEST(ApplicationTest, RejectsBadArguments)
{
    EXPECT_EQ(runCli({"explode"}), 1);
    EXPECT_EQ(runCli({"compress", "--input", "a.txt"}), 1);
    EXPECT_EQ(runCli({"compress", "-i", "a.txt", "-o", "b.hf", "--bogus"}), 1);
    EXPECT_EQ(runCli({"compress", "-i", "a.txt", "-o", "b.hf", "--debug", "2"}), 1);
}

TEST(ApplicationTest, RejectsMissingInput)
{
    ScopedTempDir temp("huffpack_cli_missing");
    const auto output = temp.path() / "out.hf";
    EXPECT_EQ(runCli({"compress", "-i", (temp.path() / "absent").string(), "-o", output.string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(ApplicationTest, CompressThenDecompress)
{
    ScopedTempDir temp("huffpack_cli");
    const auto source = temp.path() / "notes.txt";
    const auto compressed = temp.path() / "notes.hf";
    const auto restored = temp.path() / "notes.out";

    writeBinaryFile(source, "mississippi river banks, mississippi river boats\n");

    EXPECT_EQ(runCli({"compress", "--input", source.string(), "--output", compressed.string(), "--stats"}), 0);
    EXPECT_EQ(runCli({"decompress", "-i", compressed.string(), "-o", restored.string(), "-d", "1"}), 0);
    EXPECT_EQ(readBinaryFile(source), readBinaryFile(restored));
}

TEST(ApplicationTest, DecompressRejectsForeignFile)
{
    ScopedTempDir temp("huffpack_cli_foreign");
    const auto source = temp.path() / "plain.txt";
    const auto restored = temp.path() / "plain.out";

    writeBinaryFile(source, "not a huffpack stream");
    EXPECT_EQ(runCli({"decompress", "-i", source.string(), "-o", restored.string()}), 1);
    EXPECT_FALSE(std::filesystem::exists(restored));
}

} // namespace
