#include "chunkdrive/client/coordinator.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "chunkdrive/client/cancellation.hpp"
#include "chunkdrive/client/integrity.hpp"
#include "chunkdrive/client/reassembler.hpp"
#include "chunkdrive/client/session_finalizer.hpp"

namespace chunkdrive::client
{

    namespace
    {

        std::size_t resolve_pool_size(std::size_t requested, std::size_t part_count)
        {
            const auto bounded = std::min(requested, part_count);
            return bounded == 0 ? 1 : bounded;
        }

        std::uint64_t payload_length(const TransferJob &job)
        {
            return job.byte_range ? job.byte_range->length() : job.total_size;
        }

    } // namespace

    TransferCoordinator::TransferCoordinator(FileService &service, TransferSettings settings, Logger logger)
        : service_(service), settings_(std::move(settings)), logger_(std::move(logger))
    {
    }

    TransferResult TransferCoordinator::run(const TransferJob &job, std::vector<Part> parts, ProgressCallback progress)
    {
        bytes_done_ = 0;
        progress_callback_ = std::move(progress);

        logger_.log("job", job.id, " ", to_string(job.direction), " start: ", parts.size(), " part(s), ",
                    payload_length(job), " bytes, concurrency ", job.concurrency,
                    job.single_part ? ", single request" : "");

        TransferResult result;
        if (job.direction == Direction::Upload)
        {
            result = job.single_part ? run_single_upload(job, parts) : run_upload(job, parts);
        }
        else
        {
            result = run_download(job, parts);
        }

        if (result.ok())
        {
            logger_.log("job", job.id, " complete: ", result.size, " bytes, digest ", result.checksum);
        }
        else
        {
            logger_.warn("error", job.id, " failed: ", describe(result.error));
        }
        return result;
    }

    void TransferCoordinator::record_progress(const TransferJob &job, std::uint64_t bytes)
    {
        std::lock_guard lock(progress_mutex_);
        const auto done = bytes_done_ += bytes;
        if (progress_callback_)
        {
            progress_callback_(done, payload_length(job));
        }
    }

    bool TransferCoordinator::dispatch(const TransferJob &job, std::vector<Part> &parts, const PartTask &task,
                                       Outcome &outcome)
    {
        CancellationToken cancellation;
        PartWorker worker(service_, settings_, cancellation, logger_);
        std::mutex outcome_mutex;
        bool failed = false;

        {
            boost::asio::thread_pool pool(resolve_pool_size(job.concurrency, parts.size()));
            for (auto &part : parts)
            {
                boost::asio::post(pool, [&, this]
                                  {
                    if (cancellation.is_cancelled())
                    {
                        return;
                    }
                    TransferError error;
                    if (task(worker, part, error))
                    {
                        record_progress(job, part.length);
                        return;
                    }
                    std::lock_guard lock(outcome_mutex);
                    outcome.failures.push_back(error);
                    if (!failed && error.code != ErrorCode::Cancelled)
                    {
                        failed = true;
                        outcome.cause = error;
                        logger_.warn("job", job.id, " cancelling outstanding parts after ", describe(error));
                        cancellation.cancel();
                    } });
            }
            pool.join();
        }

        if (!failed && !outcome.failures.empty())
        {
            failed = true;
            outcome.cause = outcome.failures.front();
        }
        return !failed;
    }

    TransferResult TransferCoordinator::fail(const TransferJob &job, std::vector<Part> &parts, Outcome outcome)
    {
        auto result = make_failed_result(job.id, std::move(outcome.cause));
        result.part_failures = std::move(outcome.failures);
        result.parts = std::move(parts);
        result.bytes_transferred = bytes_done_.load();
        return result;
    }

    TransferResult TransferCoordinator::run_single_upload(const TransferJob &job, std::vector<Part> &parts)
    {
        CancellationToken cancellation;
        PartWorker worker(service_, settings_, cancellation, logger_);
        protocol::RemoteFile remote;
        Outcome outcome;
        if (parts.size() != 1 || !worker.upload_whole(job, parts.front(), remote, outcome.cause))
        {
            if (parts.size() != 1)
            {
                outcome.cause = make_error(ErrorCode::TransferPermanent, "Single-part upload needs exactly one part");
            }
            outcome.failures.push_back(outcome.cause);
            return fail(job, parts, std::move(outcome));
        }
        record_progress(job, parts.front().length);

        TransferResult result;
        result.job_id = job.id;
        result.state = JobState::Complete;
        result.size = remote.size;
        result.checksum = remote.content_digest.value_or(parts.front().checksum);
        result.remote_file = std::move(remote);
        result.bytes_transferred = bytes_done_.load();
        result.parts = std::move(parts);
        return result;
    }

    TransferResult TransferCoordinator::run_upload(const TransferJob &job, std::vector<Part> &parts)
    {
        UploadSession session(service_, settings_, logger_);
        Outcome outcome;
        if (!session.initiate(job, outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        session.begin_parts();
        const auto &file_id = session.file_id();
        const PartTask task = [&](PartWorker &worker, Part &part, TransferError &error)
        {
            return worker.upload_part(job, file_id, part, error);
        };
        if (!dispatch(job, parts, task, outcome))
        {
            session.abort(describe(outcome.cause));
            return fail(job, parts, std::move(outcome));
        }

        std::vector<protocol::PartToken> tokens;
        protocol::RemoteFile remote;
        if (!session.acknowledge_parts(parts, tokens, outcome.cause) ||
            !session.finalize(job, tokens, remote, outcome.cause))
        {
            session.abort(describe(outcome.cause));
            return fail(job, parts, std::move(outcome));
        }

        if (!remote.content_digest)
        {
            logger_.log("verify", job.id, " finalized file has no digest, skipping whole-file verification");
        }
        std::string checksum;
        if (!verify_whole_file(remote.content_digest, job.local_path, checksum, outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        TransferResult result;
        result.job_id = job.id;
        result.state = JobState::Complete;
        result.size = remote.size;
        result.checksum = std::move(checksum);
        result.remote_file = std::move(remote);
        result.bytes_transferred = bytes_done_.load();
        result.parts = std::move(parts);
        return result;
    }

    TransferResult TransferCoordinator::run_download(const TransferJob &job, std::vector<Part> &parts)
    {
        const bool in_place = job.byte_range && job.range_in_place;
        Reassembler reassembler(
            Reassembler::Options{
                .destination = job.local_path,
                .total_length = in_place ? job.byte_range->last + 1 : payload_length(job),
                .base_offset = job.byte_range && !in_place ? job.byte_range->first : 0,
                .part_count = parts.size(),
                .strategy = job.temp_directory ? ReassemblyStrategy::TempParts : job.reassembly,
                .temp_directory = job.temp_directory,
                .tag = job.id,
            },
            logger_);

        Outcome outcome;
        if (!reassembler.prepare(outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        const PartTask task = [&](PartWorker &worker, Part &part, TransferError &error)
        {
            return worker.download_part(job, part, reassembler, error);
        };
        if (!dispatch(job, parts, task, outcome) || !reassembler.assemble(outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        const auto expected = job.byte_range ? std::optional<std::string>{} : job.expected_digest;
        if (!expected)
        {
            logger_.log("verify", job.id, job.byte_range ? " byte range download" : " remote file has no digest",
                        ", skipping whole-file verification");
        }
        std::string checksum;
        if (!verify_whole_file(expected, reassembler.working_path(), checksum, outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        LocalFile local;
        if (!reassembler.commit(local, outcome.cause))
        {
            return fail(job, parts, std::move(outcome));
        }

        TransferResult result;
        result.job_id = job.id;
        result.state = JobState::Complete;
        result.local_path = local.path;
        result.size = local.size;
        result.checksum = std::move(checksum);
        result.bytes_transferred = bytes_done_.load();
        result.parts = std::move(parts);
        return result;
    }

} // namespace chunkdrive::client
