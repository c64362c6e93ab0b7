#include "chunkdrive/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkdrive::protocol
{

    namespace
    {

        struct UploadStatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<UploadStatusMapping, 3> kUploadStatusMappings{{
            {UploadStatus::Pending, "pending"},
            {UploadStatus::Complete, "complete"},
            {UploadStatus::Aborted, "aborted"},
        }};

        constexpr std::size_t kMaxErrorExcerpt = 256;

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kUploadStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kUploadStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RemoteFile &file)
    {
        json = {
            {"Id", file.id},
            {"Name", file.name},
            {"Path", file.path},
            {"Size", file.size},
            {"ContentType", file.content_type},
            {"UploadStatus", to_string(file.upload_status)},
        };
        if (file.content_digest)
        {
            json["ContentDigest"] = *file.content_digest;
        }
    }

    void from_json(const nlohmann::json &json, RemoteFile &file)
    {
        file.id = json.at("Id").get<std::string>();
        file.name = json.value("Name", std::string{});
        file.path = json.value("Path", file.name);
        file.size = json.value("Size", 0ULL);
        file.content_type = json.value("ContentType", std::string{});
        const auto status_label = json.value("UploadStatus", std::string{"complete"});
        auto status = upload_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown upload status: " + status_label);
        }
        file.upload_status = *status;
        if (auto it = json.find("ContentDigest"); it != json.end() && it->is_string())
        {
            file.content_digest = it->get<std::string>();
        }
        else
        {
            file.content_digest.reset();
        }
    }

    void to_json(nlohmann::json &json, const PartAck &ack)
    {
        json = {{"ETag", ack.etag}};
        if (ack.content_digest)
        {
            json["ContentDigest"] = *ack.content_digest;
        }
    }

    void from_json(const nlohmann::json &json, PartAck &ack)
    {
        ack.etag = json.at("ETag").get<std::string>();
        if (auto it = json.find("ContentDigest"); it != json.end() && it->is_string())
        {
            ack.content_digest = it->get<std::string>();
        }
        else
        {
            ack.content_digest.reset();
        }
    }

    void to_json(nlohmann::json &json, const PartToken &token)
    {
        json = {
            {"PartNumber", token.part_number},
            {"ETag", token.etag},
        };
    }

    void from_json(const nlohmann::json &json, PartToken &token)
    {
        token.part_number = json.at("PartNumber").get<std::uint32_t>();
        token.etag = json.at("ETag").get<std::string>();
    }

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request)
    {
        json = {{"Parts", request.parts}};
    }

    void from_json(const nlohmann::json &json, CompleteUploadRequest &request)
    {
        request.parts = json.value("Parts", std::vector<PartToken>{});
    }

    void to_json(nlohmann::json &json, const ResponseStatus &status)
    {
        json = {
            {"ErrorCode", status.error_code},
            {"Message", status.message},
        };
    }

    void from_json(const nlohmann::json &json, ResponseStatus &status)
    {
        status.error_code = json.value("ErrorCode", std::string{});
        status.message = json.value("Message", std::string{});
    }

    nlohmann::json wrap_response(const nlohmann::json &payload)
    {
        return nlohmann::json{{"Response", payload}};
    }

    const nlohmann::json &unwrap_response(const nlohmann::json &body)
    {
        return body.at("Response");
    }

    std::string describe_error_body(std::string_view body)
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (!json.is_discarded() && json.is_object())
        {
            if (auto it = json.find("ResponseStatus"); it != json.end() && it->is_object())
            {
                const auto status = it->get<ResponseStatus>();
                if (status.error_code.empty())
                {
                    return status.message;
                }
                return status.error_code + ": " + status.message;
            }
        }
        if (body.size() > kMaxErrorExcerpt)
        {
            return std::string(body.substr(0, kMaxErrorExcerpt)) + "...";
        }
        return std::string(body);
    }

} // namespace chunkdrive::protocol
