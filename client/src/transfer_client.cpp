#include "chunkdrive/client/transfer_client.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "chunkdrive/chunk_plan.hpp"

namespace chunkdrive::client
{

    TransferClient::TransferClient(HttpClient &http, ServiceConfig service, TransferSettings settings, Logger logger)
        : files_(http, std::move(service), logger), settings_(std::move(settings)), logger_(std::move(logger))
    {
    }

    std::string TransferClient::next_job_id(Direction direction)
    {
        const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        return std::string(to_string(direction)) + "-" + std::to_string(stamp) + "-" +
               std::to_string(++job_counter_);
    }

    std::size_t TransferClient::resolve_concurrency(const std::optional<std::size_t> &requested,
                                                    std::size_t part_count) const
    {
        const auto wanted = requested && *requested > 0 ? *requested : settings_.default_concurrency;
        return std::max<std::size_t>(1, std::min(wanted, part_count));
    }

    bool TransferClient::stat(const std::string &file_id, protocol::RemoteFile &file, TransferError &error)
    {
        return files_.get_file(file_id, file, error);
    }

    TransferResult TransferClient::upload(const UploadRequest &request, ProgressCallback progress)
    {
        const auto job_id = next_job_id(Direction::Upload);

        const auto part_size = request.part_size.value_or(settings_.default_upload_part_size);
        TransferError error;
        if (!validate_part_size(part_size, settings_.upload_bounds, error))
        {
            return make_failed_result(job_id, std::move(error));
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.local_path, ec))
        {
            return make_failed_result(job_id, make_error(ErrorCode::NotFound,
                                                         "Local file not found: " + request.local_path.string()));
        }
        const auto total_size = std::filesystem::file_size(request.local_path, ec);
        if (ec)
        {
            return make_failed_result(job_id, make_error(ErrorCode::IO, "Cannot stat " + request.local_path.string() +
                                                                            ": " + ec.message()));
        }

        const bool single_part =
            request.force_single_part || (!request.force_multipart && total_size <= part_size);
        std::vector<PartSpan> spans;
        if (single_part)
        {
            spans.push_back(PartSpan{.index = 1, .offset = 0, .length = total_size});
        }
        else if (!plan_parts(total_size, part_size, settings_.upload_bounds, spans, error))
        {
            return make_failed_result(job_id, std::move(error));
        }

        TransferJob job{
            .id = job_id,
            .direction = Direction::Upload,
            .local_path = request.local_path,
            .total_size = total_size,
            .part_size = part_size,
            .concurrency = resolve_concurrency(request.concurrency, spans.size()),
            .single_part = single_part,
            .remote_directory = request.remote_directory,
            .remote_name = request.file_name.empty() ? request.local_path.filename().string() : request.file_name,
            .content_type = request.content_type.empty() ? "application/octet-stream" : request.content_type,
        };

        TransferCoordinator coordinator(files_, settings_, logger_);
        return coordinator.run(job, make_parts(spans), std::move(progress));
    }

    std::filesystem::path TransferClient::destination_for(const DownloadRequest &request,
                                                          const protocol::RemoteFile &file) const
    {
        auto directory = request.local_directory;
        if (request.create_remote_dirs && !file.path.empty())
        {
            const auto remote_parent = std::filesystem::path(file.path).parent_path().relative_path();
            if (!remote_parent.empty())
            {
                directory /= remote_parent;
            }
        }
        std::string name = request.local_name.value_or(file.name);
        if (name.empty())
        {
            name = file.id;
        }
        return directory / std::filesystem::path(name).filename();
    }

    TransferResult TransferClient::download(const DownloadRequest &request, ProgressCallback progress)
    {
        const auto job_id = next_job_id(Direction::Download);

        const auto part_size = request.part_size.value_or(settings_.default_download_part_size);
        TransferError error;
        if (!validate_part_size(part_size, settings_.download_bounds, error))
        {
            return make_failed_result(job_id, std::move(error));
        }
        std::optional<ByteRange> range;
        if (request.byte_range)
        {
            ByteRange validated;
            if (!validate_byte_range(*request.byte_range, settings_.max_range_size, validated, error))
            {
                return make_failed_result(job_id, std::move(error));
            }
            range = validated;
        }

        protocol::RemoteFile remote;
        if (!files_.get_file(request.file_id, remote, error))
        {
            return make_failed_result(job_id, std::move(error));
        }
        if (remote.upload_status != protocol::UploadStatus::Complete)
        {
            return make_failed_result(job_id, make_error(ErrorCode::TransferPermanent,
                                                         "Remote file " + remote.id + " is " +
                                                             std::string(protocol::to_string(remote.upload_status))));
        }
        if (range && range->last >= remote.size)
        {
            return make_failed_result(job_id, make_error(ErrorCode::ByteRange,
                                                         "Range end " + std::to_string(range->last) +
                                                             " lies beyond the last byte of a " +
                                                             std::to_string(remote.size) + "-byte file"));
        }

        const bool single_part = request.force_single_part || (!range && remote.size <= part_size);
        std::vector<PartSpan> spans;
        if (single_part)
        {
            spans.push_back(range ? PartSpan{.index = 1, .offset = range->first, .length = range->length()}
                                  : PartSpan{.index = 1, .offset = 0, .length = remote.size});
        }
        else if (range ? !plan_range(*range, part_size, settings_.download_bounds, spans, error)
                       : !plan_parts(remote.size, part_size, settings_.download_bounds, spans, error))
        {
            return make_failed_result(job_id, std::move(error));
        }

        TransferJob job{
            .id = job_id,
            .direction = Direction::Download,
            .local_path = destination_for(request, remote),
            .remote_id = remote.id.empty() ? request.file_id : remote.id,
            .total_size = remote.size,
            .part_size = part_size,
            .concurrency = resolve_concurrency(request.concurrency, spans.size()),
            .byte_range = range,
            .range_in_place = range && !request.standalone_range,
            .temp_directory = request.temp_directory,
            .reassembly = settings_.reassembly,
            .single_part = single_part,
            .expected_digest = remote.content_digest,
        };

        TransferCoordinator coordinator(files_, settings_, logger_);
        return coordinator.run(job, make_parts(spans), std::move(progress));
    }

} // namespace chunkdrive::client
