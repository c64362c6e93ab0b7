/**
 * ChunkDrive - Content digests built on libsodium (BLAKE2b, hex encoded).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace chunkdrive::crypto
{

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_string(std::string_view data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace chunkdrive::crypto
