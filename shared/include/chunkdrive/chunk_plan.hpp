/**
 * ChunkDrive - Partitioning of a byte range into transfer parts.
 *
 * The planner is pure: it touches neither the network nor the filesystem, so every
 * configuration error it reports is raised before a transfer starts.
 */
#pragma once

#include <cstdint>
#include <vector>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive
{

    constexpr std::uint64_t kMebibyte = 1024ULL * 1024ULL;

    struct PartSizeBounds
    {
        std::uint64_t min_part_size{};
        std::uint64_t max_part_size{};
        std::uint32_t max_part_count{10000};
    };

    // Uploads: the provider wants parts above 5 MB and at most 25 MB.
    constexpr PartSizeBounds kDefaultUploadBounds{
        .min_part_size = 6 * kMebibyte,
        .max_part_size = 25 * kMebibyte,
        .max_part_count = 10000,
    };

    constexpr PartSizeBounds kDefaultDownloadBounds{
        .min_part_size = 1 * kMebibyte,
        .max_part_size = 100 * kMebibyte,
        .max_part_count = 10000,
    };

    constexpr std::uint64_t kDefaultMaxRangeSize = 10000000;

    // Inclusive on both ends.
    struct ByteRange
    {
        std::uint64_t first{};
        std::uint64_t last{};

        constexpr std::uint64_t length() const noexcept
        {
            return last - first + 1;
        }

        friend bool operator==(const ByteRange &, const ByteRange &) = default;
    };

    struct PartSpan
    {
        std::uint32_t index{};   // 1-based
        std::uint64_t offset{};  // absolute offset in the remote file
        std::uint64_t length{};

        friend bool operator==(const PartSpan &, const PartSpan &) = default;
    };

    bool validate_part_size(std::uint64_t part_size, const PartSizeBounds &bounds, TransferError &error);

    // Accepts exactly two ordered endpoints whose span does not exceed `max_range_size`.
    bool validate_byte_range(const std::vector<std::uint64_t> &endpoints, std::uint64_t max_range_size,
                             ByteRange &range, TransferError &error);

    bool plan_parts(std::uint64_t total_size, std::uint64_t part_size, const PartSizeBounds &bounds,
                    std::vector<PartSpan> &parts, TransferError &error);

    bool plan_range(const ByteRange &range, std::uint64_t part_size, const PartSizeBounds &bounds,
                    std::vector<PartSpan> &parts, TransferError &error);

} // namespace chunkdrive
