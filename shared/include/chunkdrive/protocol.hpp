/**
 * ChunkDrive - REST payload schema and serialization helpers.
 *
 * Successful bodies arrive wrapped as {"Response": {...}}; failures as
 * {"ResponseStatus": {"ErrorCode": ..., "Message": ...}}.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkdrive::protocol
{

    inline constexpr std::string_view kAccessTokenHeader = "x-access-token";
    inline constexpr std::string_view kContentDigestHeader = "X-Content-Digest";

    enum class UploadStatus : std::uint8_t
    {
        Pending,
        Complete,
        Aborted
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    struct RemoteFile
    {
        std::string id;
        std::string name;
        std::string path;
        std::uint64_t size{};
        std::string content_type;
        UploadStatus upload_status{UploadStatus::Pending};
        std::optional<std::string> content_digest{};
    };

    void to_json(nlohmann::json &json, const RemoteFile &file);
    void from_json(const nlohmann::json &json, RemoteFile &file);

    // Server acknowledgement of one received part.
    struct PartAck
    {
        std::string etag;
        std::optional<std::string> content_digest{};
    };

    void to_json(nlohmann::json &json, const PartAck &ack);
    void from_json(const nlohmann::json &json, PartAck &ack);

    struct PartToken
    {
        std::uint32_t part_number{};
        std::string etag;

        friend bool operator==(const PartToken &, const PartToken &) = default;
    };

    void to_json(nlohmann::json &json, const PartToken &token);
    void from_json(const nlohmann::json &json, PartToken &token);

    struct CompleteUploadRequest
    {
        std::vector<PartToken> parts;
    };

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request);
    void from_json(const nlohmann::json &json, CompleteUploadRequest &request);

    struct ResponseStatus
    {
        std::string error_code;
        std::string message;
    };

    void to_json(nlohmann::json &json, const ResponseStatus &status);
    void from_json(const nlohmann::json &json, ResponseStatus &status);

    nlohmann::json wrap_response(const nlohmann::json &payload);

    // Throws nlohmann::json::exception when the body is not a wrapped response.
    const nlohmann::json &unwrap_response(const nlohmann::json &body);

    // Best-effort description of an error body; falls back to the raw text.
    std::string describe_error_body(std::string_view body);

} // namespace chunkdrive::protocol
