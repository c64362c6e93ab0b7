#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/http_client.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    struct DownloadedContent
    {
        std::string bytes;
        // Digest the server attached to this span, if any.
        std::optional<std::string> digest{};
    };

    // Maps a non-success HTTP exchange onto the error taxonomy.
    TransferError classify_failure(const HttpResponse &response, std::string_view operation);

    std::string url_encode(std::string_view value);

    // REST wrapper over the remote object store. Holds no per-transfer state, so one instance
    // serves every worker of a job concurrently.
    class FileService
    {
    public:
        FileService(HttpClient &http, ServiceConfig config, Logger logger);

        bool get_file(const std::string &file_id, protocol::RemoteFile &file, TransferError &error);

        bool initiate_upload(const std::string &name, const std::string &directory, const std::string &content_type,
                             protocol::RemoteFile &file, TransferError &error);

        bool upload_part(const std::string &file_id, std::uint32_t part_number, const std::string &digest,
                         std::string bytes, protocol::PartAck &ack, TransferError &error);

        bool upload_single(const std::string &name, const std::string &directory, const std::string &content_type,
                           std::string bytes, protocol::RemoteFile &file, TransferError &error);

        bool complete_upload(const std::string &file_id, const std::vector<protocol::PartToken> &parts,
                             protocol::RemoteFile &file, TransferError &error);

        bool abort_upload(const std::string &file_id, TransferError &error);

        // Without a range the whole file is requested and a 200 is expected.
        bool download_content(const std::string &file_id, const std::optional<ByteRange> &range,
                              DownloadedContent &content, TransferError &error);

    private:
        HttpRequest make_request(HttpMethod method, std::string path) const;
        HttpResponse exchange(const HttpRequest &request);
        bool parse_remote_file(const HttpResponse &response, std::string_view operation, protocol::RemoteFile &file,
                               TransferError &error);
        std::string upload_target(const std::string &name, const std::string &directory, bool multipart) const;

        HttpClient &http_;
        ServiceConfig config_;
        Logger logger_;
    };

} // namespace chunkdrive::client
