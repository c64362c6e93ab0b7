#include "fake_object_store.hpp"

#include <algorithm>
#include <cstdio>
#include <span>
#include <utility>

#include <nlohmann/json.hpp>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::tests
{

    namespace
    {

        std::string digest_of(const std::string &bytes)
        {
            return crypto::hash_bytes(std::as_bytes(std::span(bytes.data(), bytes.size())));
        }

        client::HttpResponse json_response(unsigned status, const nlohmann::json &payload)
        {
            client::HttpResponse response;
            response.status = status;
            response.headers["Content-Type"] = "application/json";
            response.body = protocol::wrap_response(payload).dump();
            return response;
        }

        client::HttpResponse error_response(unsigned status, const std::string &code, const std::string &message)
        {
            client::HttpResponse response;
            response.status = status;
            response.headers["Content-Type"] = "application/json";
            response.body =
                nlohmann::json{{"ResponseStatus", protocol::ResponseStatus{.error_code = code, .message = message}}}
                    .dump();
            return response;
        }

        std::string url_decode(const std::string &value)
        {
            std::string decoded;
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] == '%' && i + 2 < value.size())
                {
                    decoded.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
                    i += 2;
                }
                else
                {
                    decoded.push_back(value[i]);
                }
            }
            return decoded;
        }

        std::map<std::string, std::string> parse_query(const std::string &query)
        {
            std::map<std::string, std::string> values;
            std::size_t start = 0;
            while (start < query.size())
            {
                auto end = query.find('&', start);
                if (end == std::string::npos)
                {
                    end = query.size();
                }
                const auto pair = query.substr(start, end - start);
                const auto eq = pair.find('=');
                if (eq == std::string::npos)
                {
                    values[url_decode(pair)] = "";
                }
                else
                {
                    values[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
                }
                start = end + 1;
            }
            return values;
        }

        std::vector<std::string> split_path(const std::string &path)
        {
            std::vector<std::string> segments;
            std::size_t start = 0;
            while (start <= path.size())
            {
                auto end = path.find('/', start);
                if (end == std::string::npos)
                {
                    end = path.size();
                }
                if (end > start)
                {
                    segments.push_back(url_decode(path.substr(start, end - start)));
                }
                start = end + 1;
            }
            return segments;
        }

        bool take_failure(std::pair<std::uint32_t, unsigned> &failure, unsigned &status)
        {
            if (failure.first == 0)
            {
                return false;
            }
            --failure.first;
            status = failure.second;
            return true;
        }

    } // namespace

    FakeObjectStore::FakeObjectStore(std::string api_prefix, std::string access_token)
        : api_prefix_(std::move(api_prefix)), access_token_(std::move(access_token))
    {
    }

    client::HttpResponse FakeObjectStore::send(const client::HttpRequest &request)
    {
        std::lock_guard lock(mutex_);
        ++requests_;
        return handle(request);
    }

    client::HttpResponse FakeObjectStore::handle(const client::HttpRequest &request)
    {
        const auto token = client::find_header(request.headers, protocol::kAccessTokenHeader);
        if (!token || *token != access_token_)
        {
            return error_response(401, "Unauthorized", "Missing or invalid access token");
        }
        if (request.target.rfind(api_prefix_, 0) != 0)
        {
            return error_response(404, "NotFound", "Unknown API root");
        }

        const auto relative = request.target.substr(api_prefix_.size());
        const auto question = relative.find('?');
        const auto path = relative.substr(0, question);
        const auto query = question == std::string::npos ? std::map<std::string, std::string>{}
                                                         : parse_query(relative.substr(question + 1));
        const auto segments = split_path(path);
        if (segments.empty())
        {
            return error_response(404, "NotFound", "Empty path");
        }

        if (segments.front() != "files")
        {
            if (segments.back() == "files" && request.method == client::HttpMethod::Post)
            {
                return create_file(path, query, request);
            }
            return error_response(404, "NotFound", "Unknown resource " + path);
        }

        if (segments.size() < 2)
        {
            return error_response(404, "NotFound", "Missing file id");
        }
        auto it = files_.find(segments[1]);
        if (it == files_.end())
        {
            return error_response(404, "NotFound", "No file " + segments[1]);
        }
        auto &file = it->second;

        if (segments.size() == 2 && request.method == client::HttpMethod::Get)
        {
            return describe(file);
        }
        if (segments.size() == 2 && request.method == client::HttpMethod::Post)
        {
            const auto status = query.find("uploadstatus");
            if (status != query.end() && status->second == "complete")
            {
                return complete(file, request);
            }
            if (status != query.end() && status->second == "aborted")
            {
                ++aborts_;
                file.record.upload_status = protocol::UploadStatus::Aborted;
                return json_response(200, file.record);
            }
            return error_response(400, "BadRequest", "Unsupported upload status");
        }
        if (segments.size() == 3 && segments[2] == "content" && request.method == client::HttpMethod::Get)
        {
            return read_content(file, request);
        }
        if (segments.size() == 4 && segments[2] == "parts" && request.method == client::HttpMethod::Put)
        {
            return put_part(file, static_cast<std::uint32_t>(std::stoul(segments[3])), request);
        }
        return error_response(405, "MethodNotAllowed", "Unsupported request on " + path);
    }

    client::HttpResponse FakeObjectStore::create_file(const std::string &container_path,
                                                      const std::map<std::string, std::string> &query,
                                                      const client::HttpRequest &request)
    {
        const auto name = query.find("name");
        if (name == query.end() || name->second.empty())
        {
            return error_response(400, "BadRequest", "name is required for " + container_path);
        }
        const auto directory = query.count("directory") ? query.at("directory") : std::string{};
        const bool multipart = query.count("multipart") && query.at("multipart") == "true";

        StoredFile stored;
        stored.record.id = std::to_string(next_id_++);
        stored.record.name = name->second;
        stored.record.path = (directory.empty() || directory.front() != '/' ? "/" : "") + directory +
                             (directory.empty() || directory.back() == '/' ? "" : "/") + name->second;
        stored.record.content_type =
            client::find_header(request.headers, "Content-Type").value_or("application/octet-stream");
        if (multipart)
        {
            stored.record.upload_status = protocol::UploadStatus::Pending;
        }
        else
        {
            stored.bytes = request.body;
            stored.record.size = stored.bytes.size();
            stored.record.content_digest = digest_of(stored.bytes);
            stored.record.upload_status = protocol::UploadStatus::Complete;
        }
        const auto record = stored.record;
        files_.emplace(record.id, std::move(stored));
        return json_response(201, record);
    }

    client::HttpResponse FakeObjectStore::put_part(StoredFile &file, std::uint32_t part_number,
                                                   const client::HttpRequest &request)
    {
        ++part_puts_[part_number];
        unsigned status = 0;
        if (auto it = part_failures_.find(part_number); it != part_failures_.end() && take_failure(it->second, status))
        {
            return error_response(status, "Injected", "Injected failure for part " + std::to_string(part_number));
        }
        if (file.record.upload_status != protocol::UploadStatus::Pending)
        {
            return error_response(409, "Conflict", "Upload session is not open");
        }

        const auto digest = digest_of(request.body);
        const auto claimed = client::find_header(request.headers, protocol::kContentDigestHeader);
        if (!claimed || *claimed != digest)
        {
            return error_response(400, "BadDigest", "Part digest does not match its body");
        }

        file.parts[part_number] = request.body;
        const auto etag = "etag-" + file.record.id + "-" + std::to_string(part_number) + "-" +
                          std::to_string(part_puts_[part_number]);
        file.etags[part_number] = etag;

        protocol::PartAck ack{.etag = etag, .content_digest = digest};
        if (std::find(corrupted_acks_.begin(), corrupted_acks_.end(), part_number) != corrupted_acks_.end())
        {
            ack.content_digest = std::string(digest.size(), '0');
        }
        return json_response(200, ack);
    }

    client::HttpResponse FakeObjectStore::complete(StoredFile &file, const client::HttpRequest &request)
    {
        ++finalizes_;
        if (reject_finalize_)
        {
            return error_response(400, "BadRequest", "Parts are incomplete");
        }
        if (file.record.upload_status != protocol::UploadStatus::Pending)
        {
            return error_response(409, "Conflict", "Upload session is not open");
        }

        protocol::CompleteUploadRequest body;
        try
        {
            body = nlohmann::json::parse(request.body).get<protocol::CompleteUploadRequest>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            return error_response(400, "BadRequest", ex.what());
        }
        if (body.parts.size() != file.parts.size())
        {
            return error_response(400, "BadRequest", "Part list does not match received parts");
        }

        std::string assembled;
        for (std::size_t i = 0; i < body.parts.size(); ++i)
        {
            const auto &token = body.parts[i];
            const auto etag = file.etags.find(token.part_number);
            if (token.part_number != i + 1 || etag == file.etags.end() || etag->second != token.etag)
            {
                return error_response(400, "BadRequest", "Unknown part token for part " +
                                                             std::to_string(token.part_number));
            }
            assembled += file.parts.at(token.part_number);
        }

        file.bytes = std::move(assembled);
        file.parts.clear();
        file.record.size = file.bytes.size();
        file.record.content_digest = finalized_digest_ ? *finalized_digest_ : digest_of(file.bytes);
        file.pending_polls = pending_polls_;
        file.record.upload_status =
            pending_polls_ > 0 ? protocol::UploadStatus::Pending : protocol::UploadStatus::Complete;
        return json_response(200, file.record);
    }

    client::HttpResponse FakeObjectStore::describe(StoredFile &file)
    {
        if (file.pending_polls > 0 && --file.pending_polls == 0)
        {
            file.record.upload_status = protocol::UploadStatus::Complete;
        }
        return json_response(200, file.record);
    }

    client::HttpResponse FakeObjectStore::read_content(StoredFile &file, const client::HttpRequest &request)
    {
        const auto range_header = client::find_header(request.headers, "Range");
        unsigned long long first = 0;
        unsigned long long last = 0;
        const bool ranged = range_header && std::sscanf(range_header->c_str(), "bytes=%llu-%llu", &first, &last) == 2;

        if (ranged)
        {
            unsigned status = 0;
            if (auto it = range_failures_.find(first); it != range_failures_.end() && take_failure(it->second, status))
            {
                return error_response(status, "Injected", "Injected failure for range at " + std::to_string(first));
            }
        }

        client::HttpResponse response;
        if (!ranged || ignore_ranges_)
        {
            response.status = 200;
            response.body = file.bytes;
            if (file.record.content_digest)
            {
                response.headers[std::string(protocol::kContentDigestHeader)] = *file.record.content_digest;
            }
            return response;
        }

        if (first >= file.bytes.size() || first > last)
        {
            return error_response(416, "RangeNotSatisfiable", "Range outside file");
        }
        last = std::min<unsigned long long>(last, file.bytes.size() - 1);
        response.status = 206;
        response.body = file.bytes.substr(first, last - first + 1);
        response.headers["Content-Range"] = "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
                                            std::to_string(file.bytes.size());
        if (serve_part_digests_)
        {
            response.headers[std::string(protocol::kContentDigestHeader)] = digest_of(response.body);
        }
        return response;
    }

    std::string FakeObjectStore::add_file(const std::string &name, const std::string &directory,
                                          const std::string &bytes, bool record_digest)
    {
        std::lock_guard lock(mutex_);
        StoredFile stored;
        stored.record.id = std::to_string(next_id_++);
        stored.record.name = name;
        stored.record.path = directory + "/" + name;
        stored.record.size = bytes.size();
        stored.record.content_type = "application/octet-stream";
        stored.record.upload_status = protocol::UploadStatus::Complete;
        if (record_digest)
        {
            stored.record.content_digest = digest_of(bytes);
        }
        stored.bytes = bytes;
        const auto id = stored.record.id;
        files_.emplace(id, std::move(stored));
        return id;
    }

    std::optional<protocol::RemoteFile> FakeObjectStore::file(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = files_.find(id);
        if (it == files_.end())
        {
            return std::nullopt;
        }
        return it->second.record;
    }

    std::string FakeObjectStore::content(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = files_.find(id);
        return it == files_.end() ? std::string{} : it->second.bytes;
    }

    void FakeObjectStore::fail_part(std::uint32_t part_number, std::uint32_t times, unsigned status)
    {
        std::lock_guard lock(mutex_);
        part_failures_[part_number] = {times, status};
    }

    void FakeObjectStore::fail_range(std::uint64_t first_byte, std::uint32_t times, unsigned status)
    {
        std::lock_guard lock(mutex_);
        range_failures_[first_byte] = {times, status};
    }

    void FakeObjectStore::corrupt_part_ack(std::uint32_t part_number)
    {
        std::lock_guard lock(mutex_);
        corrupted_acks_.push_back(part_number);
    }

    void FakeObjectStore::set_recorded_digest(const std::string &id, std::optional<std::string> digest)
    {
        std::lock_guard lock(mutex_);
        if (auto it = files_.find(id); it != files_.end())
        {
            it->second.record.content_digest = std::move(digest);
        }
    }

    void FakeObjectStore::set_ignore_ranges(bool ignore)
    {
        std::lock_guard lock(mutex_);
        ignore_ranges_ = ignore;
    }

    void FakeObjectStore::set_serve_part_digests(bool serve)
    {
        std::lock_guard lock(mutex_);
        serve_part_digests_ = serve;
    }

    void FakeObjectStore::set_reject_finalize(bool reject)
    {
        std::lock_guard lock(mutex_);
        reject_finalize_ = reject;
    }

    void FakeObjectStore::override_finalized_digest(std::optional<std::string> digest)
    {
        std::lock_guard lock(mutex_);
        finalized_digest_.emplace(std::move(digest));
    }

    void FakeObjectStore::set_pending_polls(std::uint32_t polls)
    {
        std::lock_guard lock(mutex_);
        pending_polls_ = polls;
    }

    std::size_t FakeObjectStore::request_count() const
    {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    std::size_t FakeObjectStore::finalize_count() const
    {
        std::lock_guard lock(mutex_);
        return finalizes_;
    }

    std::size_t FakeObjectStore::abort_count() const
    {
        std::lock_guard lock(mutex_);
        return aborts_;
    }

    std::size_t FakeObjectStore::part_put_count(std::uint32_t part_number) const
    {
        std::lock_guard lock(mutex_);
        const auto it = part_puts_.find(part_number);
        return it == part_puts_.end() ? 0 : it->second;
    }

} // namespace chunkdrive::tests
