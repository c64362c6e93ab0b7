#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/file_service.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transfer_types.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    enum class SessionState : std::uint8_t
    {
        Initiated,
        PartsInFlight,
        PartsAcknowledged,
        Finalizing,
        Complete,
        Failed
    };

    std::string_view to_string(SessionState state) noexcept;

    // Server-side grouping of the parts of one multipart upload.
    //
    // Initiated -> PartsInFlight -> PartsAcknowledged -> Finalizing -> Complete, with Failed
    // reachable from every non-terminal state. The session exists on the server from the moment
    // initiate() succeeds until it is either completed or aborted.
    class UploadSession
    {
    public:
        UploadSession(FileService &service, const TransferSettings &settings, Logger logger);

        bool initiate(const TransferJob &job, TransferError &error);

        void begin_parts();

        // Checks that every part carries a token and collects the tokens in sequence order.
        bool acknowledge_parts(const std::vector<Part> &parts, std::vector<protocol::PartToken> &tokens,
                               TransferError &error);

        // Requests server-side assembly and waits for the remote file to report completion.
        // On a Complete session, returns the cached descriptor without touching the network.
        bool finalize(const TransferJob &job, const std::vector<protocol::PartToken> &tokens,
                      protocol::RemoteFile &file, TransferError &error);

        // Best effort; failures are only logged.
        void abort(std::string_view reason);

        SessionState state() const noexcept
        {
            return state_;
        }

        const std::string &file_id() const noexcept
        {
            return file_id_;
        }

    private:
        void transition(SessionState next);
        bool fail(TransferError &error, std::string message);
        bool request_completion(const std::vector<protocol::PartToken> &tokens, protocol::RemoteFile &file,
                                TransferError &error);
        bool await_complete(protocol::RemoteFile &file, TransferError &error);

        FileService &service_;
        const TransferSettings &settings_;
        Logger logger_;
        SessionState state_{SessionState::Initiated};
        std::string file_id_;
        std::optional<protocol::RemoteFile> completed_;
        bool opened_{false};
    };

} // namespace chunkdrive::client
