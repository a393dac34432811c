#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace huffpack::utils {

void ensureParentDirectory(const std::filesystem::path& path);
std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);
void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

} // namespace huffpack::utils
