#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    struct LocalFile
    {
        std::filesystem::path path;
        std::uint64_t size{};
    };

    // Collects downloaded parts into one destination file.
    //
    // Nothing appears under the destination path until commit(): positioned writes go to
    // "<destination>.part", temp-part writes go to one file per part under the temp directory.
    // Parts never overlap and every write opens its own handle, so write_chunk may be called
    // from several workers at once. Any artifact left uncommitted is removed on destruction.
    class Reassembler
    {
    public:
        struct Options
        {
            std::filesystem::path destination;
            std::uint64_t total_length{};
            // Absolute offset of the first byte; non-zero for byte-range downloads.
            std::uint64_t base_offset{};
            std::size_t part_count{1};
            ReassemblyStrategy strategy{ReassemblyStrategy::PositionedWrite};
            std::optional<std::filesystem::path> temp_directory{};
            std::string tag{"transfer"};
        };

        Reassembler(Options options, Logger logger);
        ~Reassembler();

        Reassembler(const Reassembler &) = delete;
        Reassembler &operator=(const Reassembler &) = delete;

        bool prepare(TransferError &error);

        bool write_chunk(std::uint32_t index, std::uint64_t offset, std::span<const std::byte> bytes,
                         TransferError &error);

        // Builds the complete working file; the destination is still untouched afterwards.
        bool assemble(TransferError &error);

        // Moves the assembled file into place.
        bool commit(LocalFile &file, TransferError &error);

        bool finalize(LocalFile &file, TransferError &error);

        // Removes every temporary artifact; safe to call more than once.
        void discard();

        const std::filesystem::path &working_path() const noexcept
        {
            return working_path_;
        }

    private:
        std::filesystem::path temp_part_path(std::uint32_t index) const;
        bool concatenate_parts(TransferError &error);

        Options options_;
        Logger logger_;
        std::filesystem::path working_path_;
        std::filesystem::path temp_root_;
        std::mutex mutex_;
        std::vector<bool> written_;
        // Relative offset of each written part, used when temp parts are joined.
        std::vector<std::uint64_t> offsets_;
        bool prepared_{false};
        bool assembled_{false};
        bool committed_{false};
    };

} // namespace chunkdrive::client
