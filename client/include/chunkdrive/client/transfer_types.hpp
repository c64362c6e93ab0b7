#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/client/config.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    enum class Direction : std::uint8_t
    {
        Upload,
        Download
    };

    enum class PartState : std::uint8_t
    {
        Pending,
        InFlight,
        Complete,
        Failed
    };

    enum class JobState : std::uint8_t
    {
        Complete,
        Failed
    };

    std::string_view to_string(Direction direction) noexcept;
    std::string_view to_string(PartState state) noexcept;
    std::string_view to_string(JobState state) noexcept;

    struct Part
    {
        std::uint32_t index{};
        std::uint64_t offset{};
        std::uint64_t length{};
        PartState state{PartState::Pending};
        std::uint32_t attempts{};
        std::string checksum;
        std::optional<std::string> token{};
    };

    std::vector<Part> make_parts(const std::vector<PartSpan> &spans);

    // Called with the aggregate byte count after each completed part.
    using ProgressCallback = std::function<void(std::uint64_t bytes_done, std::uint64_t bytes_total)>;

    struct TransferJob
    {
        std::string id;
        Direction direction{Direction::Download};
        std::filesystem::path local_path;
        std::string remote_id;
        std::uint64_t total_size{};
        std::uint64_t part_size{};
        std::size_t concurrency{1};
        std::optional<ByteRange> byte_range{};
        // Range bytes keep their remote offsets in the local file instead of starting at zero.
        bool range_in_place{false};
        std::optional<std::filesystem::path> temp_directory{};
        ReassemblyStrategy reassembly{ReassemblyStrategy::PositionedWrite};
        bool single_part{false};

        // Upload session parameters.
        std::string remote_directory;
        std::string remote_name;
        std::string content_type;

        // Whole-file digest recorded remotely, when the download has one.
        std::optional<std::string> expected_digest{};
    };

    struct TransferResult
    {
        std::string job_id;
        JobState state{JobState::Failed};
        std::optional<protocol::RemoteFile> remote_file{};
        std::optional<std::filesystem::path> local_path{};
        std::uint64_t size{};
        std::string checksum;
        std::uint64_t bytes_transferred{};
        std::vector<Part> parts;
        // The triggering failure; populated only when state is Failed.
        TransferError error{};
        std::vector<TransferError> part_failures;

        bool ok() const noexcept
        {
            return state == JobState::Complete;
        }
    };

    TransferResult make_failed_result(const std::string &job_id, TransferError error);

} // namespace chunkdrive::client
