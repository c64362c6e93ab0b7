#pragma once

#include <string>

#include "chunkdrive/client/cancellation.hpp"
#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/file_service.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/reassembler.hpp"
#include "chunkdrive/client/transfer_types.hpp"
#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::client
{

    // Moves exactly one part over the network.
    //
    // Transient failures are retried with exponential backoff up to TransferSettings::max_attempts;
    // everything else fails the part on the spot. The cancellation token is consulted before every
    // attempt and interrupts backoff sleeps. Part::attempts counts every network attempt, while
    // checksum, token and state are only updated by the attempt that succeeds.
    class PartWorker
    {
    public:
        PartWorker(FileService &service, const TransferSettings &settings, const CancellationToken &cancellation,
                   Logger logger);

        bool upload_part(const TransferJob &job, const std::string &session_file_id, Part &part,
                         TransferError &error);

        bool download_part(const TransferJob &job, Part &part, Reassembler &reassembler, TransferError &error);

        // Single-part upload: the one part covers the whole source and creates the remote file directly.
        bool upload_whole(const TransferJob &job, Part &part, protocol::RemoteFile &file, TransferError &error);

    private:
        template <typename Attempt>
        bool run_attempts(const TransferJob &job, Part &part, Attempt &&attempt, TransferError &error);

        bool read_source(const TransferJob &job, const Part &part, std::string &bytes, TransferError &error);

        FileService &service_;
        const TransferSettings &settings_;
        const CancellationToken &cancellation_;
        Logger logger_;
    };

} // namespace chunkdrive::client
