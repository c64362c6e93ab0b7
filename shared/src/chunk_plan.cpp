#include "chunkdrive/chunk_plan.hpp"

#include <limits>
#include <string>

namespace chunkdrive
{

    namespace
    {

        bool plan_span(std::uint64_t base_offset, std::uint64_t total_size, std::uint64_t part_size,
                       const PartSizeBounds &bounds, std::vector<PartSpan> &parts, TransferError &error)
        {
            if (!validate_part_size(part_size, bounds, error))
            {
                return false;
            }

            parts.clear();
            if (total_size == 0)
            {
                parts.push_back(PartSpan{.index = 1, .offset = base_offset, .length = 0});
                return true;
            }

            const auto count = (total_size + part_size - 1) / part_size;
            if (count > bounds.max_part_count)
            {
                error = make_error(ErrorCode::InvalidPartSize,
                                   "Part size " + std::to_string(part_size) + " yields " + std::to_string(count) +
                                       " parts, limit is " + std::to_string(bounds.max_part_count));
                return false;
            }

            parts.reserve(static_cast<std::size_t>(count));
            for (std::uint64_t i = 0; i < count; ++i)
            {
                const auto offset = i * part_size;
                const auto length = (i + 1 == count) ? total_size - offset : part_size;
                parts.push_back(PartSpan{
                    .index = static_cast<std::uint32_t>(i + 1),
                    .offset = base_offset + offset,
                    .length = length,
                });
            }
            return true;
        }

    } // namespace

    bool validate_part_size(std::uint64_t part_size, const PartSizeBounds &bounds, TransferError &error)
    {
        if (part_size < bounds.min_part_size || part_size > bounds.max_part_size || part_size == 0)
        {
            error = make_error(ErrorCode::InvalidPartSize,
                               "Part size " + std::to_string(part_size) + " outside [" +
                                   std::to_string(bounds.min_part_size) + ", " +
                                   std::to_string(bounds.max_part_size) + "]");
            return false;
        }
        return true;
    }

    bool validate_byte_range(const std::vector<std::uint64_t> &endpoints, std::uint64_t max_range_size,
                             ByteRange &range, TransferError &error)
    {
        if (endpoints.size() != 2)
        {
            error = make_error(ErrorCode::ByteRange, "Byte range needs a start and an end, got " +
                                                         std::to_string(endpoints.size()) + " values");
            return false;
        }
        const auto first = endpoints[0];
        const auto last = endpoints[1];
        if (first > last)
        {
            error = make_error(ErrorCode::ByteRange, "Byte range start " + std::to_string(first) +
                                                         " is after end " + std::to_string(last));
            return false;
        }
        // last - first is the span minus one and cannot wrap once the endpoints are ordered.
        if (last - first >= max_range_size)
        {
            error = make_error(ErrorCode::ByteRange, "Byte range " + std::to_string(first) + "-" +
                                                         std::to_string(last) + " exceeds limit of " +
                                                         std::to_string(max_range_size) + " bytes");
            return false;
        }
        range = ByteRange{.first = first, .last = last};
        return true;
    }

    bool plan_parts(std::uint64_t total_size, std::uint64_t part_size, const PartSizeBounds &bounds,
                    std::vector<PartSpan> &parts, TransferError &error)
    {
        return plan_span(0, total_size, part_size, bounds, parts, error);
    }

    bool plan_range(const ByteRange &range, std::uint64_t part_size, const PartSizeBounds &bounds,
                    std::vector<PartSpan> &parts, TransferError &error)
    {
        if (range.first > range.last)
        {
            error = make_error(ErrorCode::ByteRange, "Byte range is misordered");
            return false;
        }
        if (range.last - range.first == std::numeric_limits<std::uint64_t>::max())
        {
            error = make_error(ErrorCode::ByteRange, "Byte range length does not fit in 64 bits");
            return false;
        }
        return plan_span(range.first, range.length(), part_size, bounds, parts, error);
    }

} // namespace chunkdrive
