#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/coordinator.hpp"
#include "chunkdrive/client/file_service.hpp"
#include "chunkdrive/client/http_client.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transfer_types.hpp"

namespace chunkdrive::client
{

    struct UploadRequest
    {
        std::filesystem::path local_path;
        std::string remote_directory;
        // Defaults to the local file name.
        std::string file_name;
        std::string content_type{"application/octet-stream"};
        std::optional<std::uint64_t> part_size{};
        std::optional<std::size_t> concurrency{};
        bool force_single_part{false};
        bool force_multipart{false};
    };

    struct DownloadRequest
    {
        std::string file_id;
        std::filesystem::path local_directory;
        // Inclusive [start, end]; anything other than two ordered endpoints is rejected.
        std::optional<std::vector<std::uint64_t>> byte_range{};
        // When false the range is written at its own offsets and the bytes before it read as zeros.
        bool standalone_range{true};
        std::optional<std::uint64_t> part_size{};
        std::optional<std::size_t> concurrency{};
        std::optional<std::string> local_name{};
        bool create_remote_dirs{false};
        std::optional<std::filesystem::path> temp_directory{};
        bool force_single_part{false};
    };

    // Entry point for callers: validates a request, plans it and runs it to completion.
    // Part size and byte range are checked before any request reaches the service.
    class TransferClient
    {
    public:
        TransferClient(HttpClient &http, ServiceConfig service, TransferSettings settings, Logger logger);

        TransferResult upload(const UploadRequest &request, ProgressCallback progress = {});
        TransferResult download(const DownloadRequest &request, ProgressCallback progress = {});

        bool stat(const std::string &file_id, protocol::RemoteFile &file, TransferError &error);

        const TransferSettings &settings() const noexcept
        {
            return settings_;
        }

    private:
        std::string next_job_id(Direction direction);
        std::size_t resolve_concurrency(const std::optional<std::size_t> &requested, std::size_t part_count) const;
        std::filesystem::path destination_for(const DownloadRequest &request, const protocol::RemoteFile &file) const;

        FileService files_;
        TransferSettings settings_;
        Logger logger_;
        std::atomic<std::uint32_t> job_counter_{0};
    };

} // namespace chunkdrive::client
