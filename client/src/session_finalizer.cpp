#include "chunkdrive/client/session_finalizer.hpp"

#include <algorithm>
#include <array>
#include <thread>
#include <utility>

namespace chunkdrive::client
{

    namespace
    {

        constexpr std::array<std::string_view, 6> kSessionStateNames = {
            "initiated", "parts_in_flight", "parts_acknowledged", "finalizing", "complete", "failed"};

    } // namespace

    std::string_view to_string(SessionState state) noexcept
    {
        const auto index = static_cast<std::size_t>(state);
        return index < kSessionStateNames.size() ? kSessionStateNames[index] : "unknown";
    }

    UploadSession::UploadSession(FileService &service, const TransferSettings &settings, Logger logger)
        : service_(service), settings_(settings), logger_(std::move(logger))
    {
    }

    void UploadSession::transition(SessionState next)
    {
        logger_.log("session", file_id_.empty() ? std::string("<new>") : file_id_, " ", to_string(state_), " -> ",
                    to_string(next));
        state_ = next;
    }

    bool UploadSession::fail(TransferError &error, std::string message)
    {
        transition(SessionState::Failed);
        error = make_error(ErrorCode::Finalization, std::move(message));
        return false;
    }

    bool UploadSession::initiate(const TransferJob &job, TransferError &error)
    {
        protocol::RemoteFile file;
        if (!service_.initiate_upload(job.remote_name, job.remote_directory, job.content_type, file, error))
        {
            transition(SessionState::Failed);
            return false;
        }
        file_id_ = file.id;
        opened_ = true;
        logger_.log("session", job.id, " opened upload session ", file_id_, " for ", job.remote_directory, "/",
                    job.remote_name);
        return true;
    }

    void UploadSession::begin_parts()
    {
        if (state_ == SessionState::Initiated)
        {
            transition(SessionState::PartsInFlight);
        }
    }

    bool UploadSession::acknowledge_parts(const std::vector<Part> &parts, std::vector<protocol::PartToken> &tokens,
                                          TransferError &error)
    {
        if (state_ != SessionState::PartsInFlight)
        {
            error = make_error(ErrorCode::Finalization,
                               "Cannot acknowledge parts in state " + std::string(to_string(state_)));
            return false;
        }

        std::vector<protocol::PartToken> collected;
        collected.reserve(parts.size());
        for (const auto &part : parts)
        {
            if (part.state != PartState::Complete || !part.token)
            {
                transition(SessionState::Failed);
                error = make_error(ErrorCode::Finalization, "Part has no acknowledgement", part.index);
                return false;
            }
            collected.push_back(protocol::PartToken{.part_number = part.index, .etag = *part.token});
        }
        std::sort(collected.begin(), collected.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.part_number < rhs.part_number; });
        for (std::size_t i = 0; i < collected.size(); ++i)
        {
            if (collected[i].part_number != i + 1)
            {
                return fail(error, "Part sequence is not contiguous at " + std::to_string(i + 1));
            }
        }

        tokens = std::move(collected);
        transition(SessionState::PartsAcknowledged);
        return true;
    }

    bool UploadSession::request_completion(const std::vector<protocol::PartToken> &tokens,
                                           protocol::RemoteFile &file, TransferError &error)
    {
        auto delay = settings_.retry_backoff;
        for (std::uint32_t attempt = 1;; ++attempt)
        {
            TransferError attempt_error;
            if (service_.complete_upload(file_id_, tokens, file, attempt_error))
            {
                return true;
            }
            if (!is_retryable(attempt_error.code) || attempt >= settings_.max_attempts)
            {
                return fail(error, "Server rejected completion: " + attempt_error.message);
            }
            logger_.log("session", file_id_, " completion attempt ", attempt, " failed (", attempt_error.message,
                        "), retrying");
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    bool UploadSession::await_complete(protocol::RemoteFile &file, TransferError &error)
    {
        for (std::uint32_t poll = 0; file.upload_status == protocol::UploadStatus::Pending; ++poll)
        {
            if (poll >= settings_.finalize_poll_attempts)
            {
                return fail(error, "Remote file " + file_id_ + " did not reach complete after " +
                                       std::to_string(poll) + " polls");
            }
            std::this_thread::sleep_for(settings_.finalize_poll_interval);
            TransferError poll_error;
            if (!service_.get_file(file_id_, file, poll_error))
            {
                if (is_retryable(poll_error.code))
                {
                    logger_.log("session", file_id_, " status poll failed (", poll_error.message, ")");
                    continue;
                }
                return fail(error, "Status poll failed: " + poll_error.message);
            }
        }
        if (file.upload_status != protocol::UploadStatus::Complete)
        {
            return fail(error, "Remote file " + file_id_ + " ended in state " +
                                   std::string(protocol::to_string(file.upload_status)));
        }
        return true;
    }

    bool UploadSession::finalize(const TransferJob &job, const std::vector<protocol::PartToken> &tokens,
                                 protocol::RemoteFile &file, TransferError &error)
    {
        if (state_ == SessionState::Complete && completed_)
        {
            file = *completed_;
            return true;
        }
        if (state_ != SessionState::PartsAcknowledged)
        {
            error = make_error(ErrorCode::Finalization,
                               "Cannot finalize in state " + std::string(to_string(state_)));
            return false;
        }

        transition(SessionState::Finalizing);
        protocol::RemoteFile remote;
        if (!request_completion(tokens, remote, error) || !await_complete(remote, error))
        {
            return false;
        }
        if (remote.size != job.total_size)
        {
            return fail(error, "Remote size " + std::to_string(remote.size) + " differs from local size " +
                                   std::to_string(job.total_size));
        }

        completed_ = remote;
        transition(SessionState::Complete);
        file = std::move(remote);
        return true;
    }

    void UploadSession::abort(std::string_view reason)
    {
        if (state_ == SessionState::Complete)
        {
            return;
        }
        if (state_ != SessionState::Failed)
        {
            transition(SessionState::Failed);
        }
        if (!opened_)
        {
            return;
        }
        opened_ = false;
        TransferError error;
        if (!service_.abort_upload(file_id_, error))
        {
            logger_.warn("session", file_id_, " abort failed: ", error.message);
            return;
        }
        logger_.log("session", file_id_, " aborted: ", reason);
    }

} // namespace chunkdrive::client
