#include "chunkdrive/client/file_service.hpp"

#include <cstdio>
#include <utility>

#include <nlohmann/json.hpp>

namespace chunkdrive::client
{

    namespace
    {

        bool is_transient_status(unsigned status)
        {
            return status >= 500 || status == 408 || status == 429;
        }

        std::string range_header(const ByteRange &range)
        {
            return "bytes=" + std::to_string(range.first) + "-" + std::to_string(range.last);
        }

        // "bytes 100-199/1000" -> first/last; nullopt when absent or unparseable.
        std::optional<ByteRange> parse_content_range(const HttpHeaders &headers)
        {
            const auto value = find_header(headers, "Content-Range");
            if (!value)
            {
                return std::nullopt;
            }
            unsigned long long first = 0;
            unsigned long long last = 0;
            if (std::sscanf(value->c_str(), "bytes %llu-%llu", &first, &last) != 2)
            {
                return std::nullopt;
            }
            return ByteRange{.first = static_cast<std::uint64_t>(first), .last = static_cast<std::uint64_t>(last)};
        }

    } // namespace

    TransferError classify_failure(const HttpResponse &response, std::string_view operation)
    {
        const std::string prefix = std::string(operation) + " failed: ";
        if (response.transport_error)
        {
            const auto detail = response.timed_out ? std::string("timed out") : *response.transport_error;
            return make_error(ErrorCode::TransferTransient, prefix + detail);
        }
        const auto detail = "HTTP " + std::to_string(response.status) + " " + protocol::describe_error_body(response.body);
        if (is_transient_status(response.status))
        {
            return make_error(ErrorCode::TransferTransient, prefix + detail);
        }
        if (response.status == 404)
        {
            return make_error(ErrorCode::NotFound, prefix + detail);
        }
        return make_error(ErrorCode::TransferPermanent, prefix + detail);
    }

    std::string url_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const auto raw : value)
        {
            const auto c = static_cast<unsigned char>(raw);
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                c == '.' || c == '~' || c == '/')
            {
                encoded.push_back(static_cast<char>(c));
            }
            else
            {
                encoded.push_back('%');
                encoded.push_back(kHexDigits[(c >> 4) & 0x0F]);
                encoded.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return encoded;
    }

    FileService::FileService(HttpClient &http, ServiceConfig config, Logger logger)
        : http_(http), config_(std::move(config)), logger_(std::move(logger))
    {
    }

    HttpRequest FileService::make_request(HttpMethod method, std::string path) const
    {
        HttpRequest request;
        request.method = method;
        request.target = config_.api_prefix + path;
        request.headers[std::string(protocol::kAccessTokenHeader)] = config_.access_token;
        request.timeout = config_.request_timeout;
        return request;
    }

    HttpResponse FileService::exchange(const HttpRequest &request)
    {
        auto response = http_.send(request);
        if (response.transport_error)
        {
            logger_.warn("http", to_string(request.method), ' ', request.target, " transport error: ",
                         *response.transport_error);
        }
        else if (!response.ok())
        {
            logger_.warn("http", to_string(request.method), ' ', request.target, " status=", response.status);
        }
        return response;
    }

    bool FileService::parse_remote_file(const HttpResponse &response, std::string_view operation,
                                        protocol::RemoteFile &file, TransferError &error)
    {
        try
        {
            const auto body = nlohmann::json::parse(response.body);
            file = protocol::unwrap_response(body).get<protocol::RemoteFile>();
            return true;
        }
        catch (const std::exception &ex)
        {
            error = make_error(ErrorCode::TransferPermanent,
                               std::string(operation) + " returned a malformed file record: " + ex.what());
            return false;
        }
    }

    std::string FileService::upload_target(const std::string &name, const std::string &directory, bool multipart) const
    {
        std::string target = "/" + config_.upload_container + "/files?name=" + url_encode(name) +
                             "&directory=" + url_encode(directory);
        if (multipart)
        {
            target += "&multipart=true";
        }
        return target;
    }

    bool FileService::get_file(const std::string &file_id, protocol::RemoteFile &file, TransferError &error)
    {
        const auto response = exchange(make_request(HttpMethod::Get, "/files/" + url_encode(file_id)));
        if (!response.ok())
        {
            error = classify_failure(response, "metadata lookup");
            return false;
        }
        return parse_remote_file(response, "metadata lookup", file, error);
    }

    bool FileService::initiate_upload(const std::string &name, const std::string &directory,
                                      const std::string &content_type, protocol::RemoteFile &file, TransferError &error)
    {
        auto request = make_request(HttpMethod::Post, upload_target(name, directory, true));
        request.headers["Content-Type"] = content_type;
        const auto response = exchange(request);
        if (!response.ok())
        {
            error = classify_failure(response, "upload initiation");
            return false;
        }
        return parse_remote_file(response, "upload initiation", file, error);
    }

    bool FileService::upload_part(const std::string &file_id, std::uint32_t part_number, const std::string &digest,
                                  std::string bytes, protocol::PartAck &ack, TransferError &error)
    {
        auto request = make_request(HttpMethod::Put,
                                    "/files/" + url_encode(file_id) + "/parts/" + std::to_string(part_number));
        request.headers[std::string(protocol::kContentDigestHeader)] = digest;
        request.headers["Content-Type"] = "application/octet-stream";
        request.body = std::move(bytes);
        const auto response = exchange(request);
        if (!response.ok())
        {
            error = classify_failure(response, "part upload");
            return false;
        }
        try
        {
            const auto body = nlohmann::json::parse(response.body);
            ack = protocol::unwrap_response(body).get<protocol::PartAck>();
        }
        catch (const std::exception &ex)
        {
            error = make_error(ErrorCode::TransferPermanent, std::string("part upload returned a malformed ack: ") + ex.what());
            return false;
        }
        return true;
    }

    bool FileService::upload_single(const std::string &name, const std::string &directory,
                                    const std::string &content_type, std::string bytes, protocol::RemoteFile &file,
                                    TransferError &error)
    {
        auto request = make_request(HttpMethod::Post, upload_target(name, directory, false));
        request.headers["Content-Type"] = content_type;
        request.body = std::move(bytes);
        const auto response = exchange(request);
        if (!response.ok())
        {
            error = classify_failure(response, "single-part upload");
            return false;
        }
        return parse_remote_file(response, "single-part upload", file, error);
    }

    bool FileService::complete_upload(const std::string &file_id, const std::vector<protocol::PartToken> &parts,
                                      protocol::RemoteFile &file, TransferError &error)
    {
        auto request = make_request(HttpMethod::Post, "/files/" + url_encode(file_id) + "?uploadstatus=complete");
        request.headers["Content-Type"] = "application/json";
        request.body = nlohmann::json(protocol::CompleteUploadRequest{.parts = parts}).dump();
        const auto response = exchange(request);
        if (!response.ok())
        {
            error = classify_failure(response, "upload finalization");
            return false;
        }
        return parse_remote_file(response, "upload finalization", file, error);
    }

    bool FileService::abort_upload(const std::string &file_id, TransferError &error)
    {
        const auto response =
            exchange(make_request(HttpMethod::Post, "/files/" + url_encode(file_id) + "?uploadstatus=aborted"));
        if (!response.ok())
        {
            error = classify_failure(response, "upload abort");
            return false;
        }
        return true;
    }

    bool FileService::download_content(const std::string &file_id, const std::optional<ByteRange> &range,
                                       DownloadedContent &content, TransferError &error)
    {
        auto request = make_request(HttpMethod::Get, "/files/" + url_encode(file_id) + "/content");
        if (range)
        {
            request.headers["Range"] = range_header(*range);
        }
        auto response = exchange(request);
        if (!response.ok())
        {
            error = classify_failure(response, "content download");
            return false;
        }

        if (range)
        {
            const auto expected = range->length();
            if (response.status == 206)
            {
                const auto served = parse_content_range(response.headers);
                if (served && (served->first != range->first || served->last != range->last))
                {
                    error = make_error(ErrorCode::TransferPermanent,
                                       "server returned bytes " + std::to_string(served->first) + "-" +
                                           std::to_string(served->last) + " for a request of " +
                                           range_header(*range));
                    return false;
                }
            }
            else if (range->first != 0 || response.body.size() != expected)
            {
                error = make_error(ErrorCode::TransferPermanent,
                                   "server ignored Range header (HTTP " + std::to_string(response.status) + ")");
                return false;
            }
            if (response.body.size() != expected)
            {
                error = make_error(ErrorCode::TransferPermanent,
                                   "expected " + std::to_string(expected) + " bytes, received " +
                                       std::to_string(response.body.size()));
                return false;
            }
        }

        content.digest = find_header(response.headers, protocol::kContentDigestHeader);
        content.bytes = std::move(response.body);
        return true;
    }

} // namespace chunkdrive::client
