#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "chunkdrive/client/transfer_types.hpp"
#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    // A part with no reference digest passes; servers are not required to echo one.
    bool verify_part(const std::optional<std::string> &expected_digest, const Part &part, TransferError &error);

    // Always hashes the file into `computed`; a missing reference digest skips only the comparison.
    bool verify_whole_file(const std::optional<std::string> &expected_digest, const std::filesystem::path &path,
                           std::string &computed, TransferError &error);

    bool verify_whole_bytes(const std::string &expected_digest, std::span<const std::byte> bytes,
                            TransferError &error);

} // namespace chunkdrive::client
