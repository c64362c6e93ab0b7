#include "chunkdrive/client/part_worker.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <optional>
#include <span>
#include <utility>

#include "chunkdrive/client/integrity.hpp"
#include "chunkdrive/crypto.hpp"

namespace chunkdrive::client
{

    namespace
    {

        std::chrono::milliseconds backoff_for(std::chrono::milliseconds base, std::uint32_t attempt)
        {
            const auto shift = std::min<std::uint32_t>(attempt > 0 ? attempt - 1 : 0, 10);
            return base * (1LL << shift);
        }

        std::span<const std::byte> as_byte_span(const std::string &bytes)
        {
            return std::as_bytes(std::span(bytes.data(), bytes.size()));
        }

    } // namespace

    PartWorker::PartWorker(FileService &service, const TransferSettings &settings,
                           const CancellationToken &cancellation, Logger logger)
        : service_(service), settings_(settings), cancellation_(cancellation), logger_(std::move(logger))
    {
    }

    template <typename Attempt>
    bool PartWorker::run_attempts(const TransferJob &job, Part &part, Attempt &&attempt, TransferError &error)
    {
        part.state = PartState::InFlight;
        while (true)
        {
            if (cancellation_.is_cancelled())
            {
                part.state = PartState::Failed;
                error = make_error(ErrorCode::Cancelled, "job cancelled", part.index);
                return false;
            }

            ++part.attempts;
            TransferError attempt_error;
            if (attempt(attempt_error))
            {
                part.state = PartState::Complete;
                return true;
            }
            attempt_error.part_index = part.index;

            if (!is_retryable(attempt_error.code) || part.attempts >= settings_.max_attempts)
            {
                part.state = PartState::Failed;
                logger_.warn("part", job.id, " part=", part.index, " failed after ", part.attempts,
                             " attempt(s): ", describe(attempt_error));
                error = std::move(attempt_error);
                return false;
            }

            const auto delay = backoff_for(settings_.retry_backoff, part.attempts);
            logger_.log("part", job.id, " part=", part.index, " attempt ", part.attempts, " failed (",
                        attempt_error.message, "), retrying in ", delay.count(), "ms");
            if (cancellation_.wait_for(delay))
            {
                part.state = PartState::Failed;
                error = make_error(ErrorCode::Cancelled, "job cancelled during backoff", part.index);
                return false;
            }
        }
    }

    bool PartWorker::read_source(const TransferJob &job, const Part &part, std::string &bytes, TransferError &error)
    {
        std::ifstream in(job.local_path, std::ios::binary);
        if (!in.is_open())
        {
            error = make_error(ErrorCode::IO, "Cannot open " + job.local_path.string(), part.index);
            return false;
        }
        bytes.resize(static_cast<std::size_t>(part.length));
        in.seekg(static_cast<std::streamoff>(part.offset));
        in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != part.length)
        {
            error = make_error(ErrorCode::IO, "Short read: wanted " + std::to_string(part.length) + " bytes at offset " +
                                                  std::to_string(part.offset) + ", got " + std::to_string(in.gcount()),
                               part.index);
            return false;
        }
        return true;
    }

    bool PartWorker::upload_part(const TransferJob &job, const std::string &session_file_id, Part &part,
                                 TransferError &error)
    {
        std::string bytes;
        if (!read_source(job, part, bytes, error))
        {
            part.state = PartState::Failed;
            return false;
        }
        const auto digest = crypto::hash_bytes(as_byte_span(bytes));

        return run_attempts(job, part, [&](TransferError &attempt_error)
                            {
            protocol::PartAck ack;
            if (!service_.upload_part(session_file_id, part.index, digest, bytes, ack, attempt_error))
            {
                return false;
            }
            Part received = part;
            received.checksum = digest;
            if (!verify_part(ack.content_digest, received, attempt_error))
            {
                return false;
            }
            part.checksum = digest;
            part.token = ack.etag;
            return true; }, error);
    }

    bool PartWorker::upload_whole(const TransferJob &job, Part &part, protocol::RemoteFile &file,
                                  TransferError &error)
    {
        std::string bytes;
        if (!read_source(job, part, bytes, error))
        {
            part.state = PartState::Failed;
            return false;
        }

        return run_attempts(job, part, [&](TransferError &attempt_error)
                            {
            protocol::RemoteFile created;
            if (!service_.upload_single(job.remote_name, job.remote_directory, job.content_type, bytes, created,
                                        attempt_error))
            {
                return false;
            }
            if (created.content_digest &&
                !verify_whole_bytes(*created.content_digest, as_byte_span(bytes), attempt_error))
            {
                return false;
            }
            part.checksum = crypto::hash_bytes(as_byte_span(bytes));
            file = std::move(created);
            return true; }, error);
    }

    bool PartWorker::download_part(const TransferJob &job, Part &part, Reassembler &reassembler, TransferError &error)
    {
        std::optional<ByteRange> range;
        if (!job.single_part || job.byte_range)
        {
            range = ByteRange{.first = part.offset, .last = part.offset + part.length - 1};
        }

        return run_attempts(job, part, [&](TransferError &attempt_error)
                            {
            DownloadedContent content;
            if (!service_.download_content(job.remote_id, range, content, attempt_error))
            {
                return false;
            }
            if (content.bytes.size() != part.length)
            {
                attempt_error = make_error(ErrorCode::TransferPermanent,
                                           "expected " + std::to_string(part.length) + " bytes, received " +
                                               std::to_string(content.bytes.size()));
                return false;
            }
            Part received = part;
            received.checksum = crypto::hash_bytes(as_byte_span(content.bytes));
            if (!verify_part(content.digest, received, attempt_error))
            {
                return false;
            }
            if (!reassembler.write_chunk(part.index, part.offset, as_byte_span(content.bytes), attempt_error))
            {
                return false;
            }
            part.checksum = received.checksum;
            return true; }, error);
    }

} // namespace chunkdrive::client
