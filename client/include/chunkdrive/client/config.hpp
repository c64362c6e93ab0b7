#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/chunk_plan.hpp"

namespace chunkdrive::client
{

    enum class ReassemblyStrategy : std::uint8_t
    {
        PositionedWrite,
        TempParts
    };

    // Endpoint and credential for one remote service; passed explicitly to everything that talks to it.
    struct ServiceConfig
    {
        std::string host{"localhost"};
        std::uint16_t port{80};
        std::string api_prefix{"/v1pre3"};
        std::string access_token;
        std::string upload_container;
        std::chrono::milliseconds request_timeout{std::chrono::seconds{60}};
    };

    struct TransferSettings
    {
        PartSizeBounds upload_bounds{kDefaultUploadBounds};
        PartSizeBounds download_bounds{kDefaultDownloadBounds};
        std::uint64_t default_upload_part_size{25 * kMebibyte};
        std::uint64_t default_download_part_size{25 * kMebibyte};
        std::size_t default_concurrency{10};
        std::uint32_t max_attempts{3};
        std::chrono::milliseconds retry_backoff{std::chrono::seconds{1}};
        std::uint64_t max_range_size{kDefaultMaxRangeSize};
        std::uint32_t finalize_poll_attempts{10};
        std::chrono::milliseconds finalize_poll_interval{std::chrono::seconds{1}};
        ReassemblyStrategy reassembly{ReassemblyStrategy::PositionedWrite};
    };

    enum class CommandKind : std::uint8_t
    {
        Upload,
        Download,
        Stat
    };

    struct ClientConfig
    {
        ServiceConfig service;
        TransferSettings settings;
        std::optional<std::filesystem::path> log_path;

        CommandKind command{CommandKind::Stat};
        std::vector<std::string> positional;
        std::optional<std::string> name;
        std::optional<std::string> content_type;
        std::optional<std::uint64_t> part_size;
        std::optional<std::size_t> concurrency;
        std::optional<std::vector<std::uint64_t>> byte_range;
        bool range_in_place{false};
        std::optional<std::filesystem::path> temp_directory;
        bool mirror_remote_path{false};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    // "START-END" into its endpoints; a missing end yields a single value for later validation.
    std::vector<std::uint64_t> parse_range_argument(const std::string &value);

    std::string usage();

} // namespace chunkdrive::client
