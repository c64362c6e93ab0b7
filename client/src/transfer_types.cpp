#include "chunkdrive/client/transfer_types.hpp"

#include <utility>

namespace chunkdrive::client
{

    std::string_view to_string(Direction direction) noexcept
    {
        return direction == Direction::Upload ? "upload" : "download";
    }

    std::string_view to_string(PartState state) noexcept
    {
        switch (state)
        {
        case PartState::Pending:
            return "pending";
        case PartState::InFlight:
            return "in_flight";
        case PartState::Complete:
            return "complete";
        case PartState::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string_view to_string(JobState state) noexcept
    {
        return state == JobState::Complete ? "complete" : "failed";
    }

    std::vector<Part> make_parts(const std::vector<PartSpan> &spans)
    {
        std::vector<Part> parts;
        parts.reserve(spans.size());
        for (const auto &span : spans)
        {
            parts.push_back(Part{.index = span.index, .offset = span.offset, .length = span.length});
        }
        return parts;
    }

    TransferResult make_failed_result(const std::string &job_id, TransferError error)
    {
        TransferResult result;
        result.job_id = job_id;
        result.state = JobState::Failed;
        result.error = std::move(error);
        return result;
    }

} // namespace chunkdrive::client
