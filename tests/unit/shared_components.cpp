#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

using namespace chunkdrive;
using namespace chunkdrive::protocol;

void run_client_component_tests();

namespace
{

    void assert_tiles(const std::vector<PartSpan> &parts, std::uint64_t base, std::uint64_t total,
                      std::uint64_t part_size)
    {
        assert(!parts.empty());
        std::uint64_t expected_offset = base;
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            assert(parts[i].index == i + 1);
            assert(parts[i].offset == expected_offset);
            assert(parts[i].length <= part_size);
            if (i + 1 < parts.size())
            {
                assert(parts[i].length == part_size);
            }
            expected_offset += parts[i].length;
        }
        assert(expected_offset == base + total);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::InvalidPartSize) == "invalid_part_size");
        assert(error_code_from_int(to_int(ErrorCode::Integrity)) == ErrorCode::Integrity);
        assert(is_retryable(ErrorCode::TransferTransient));
        assert(!is_retryable(ErrorCode::TransferPermanent));
        assert(!is_retryable(ErrorCode::Integrity));

        const auto error = make_error(ErrorCode::Integrity, "digest mismatch", 3);
        assert(static_cast<bool>(error));
        assert(!static_cast<bool>(TransferError{}));
        const auto text = describe(error);
        assert(text.find("integrity") != std::string::npos);
        assert(text.find("part 3") != std::string::npos);
        assert(text.find("digest mismatch") != std::string::npos);
    }

    void test_plan_tiles_every_size()
    {
        const std::array<std::uint64_t, 3> part_sizes = {6 * kMebibyte, 10 * kMebibyte, 25 * kMebibyte};
        const std::array<std::uint64_t, 8> totals = {
            1, 11, 6 * kMebibyte - 1, 6 * kMebibyte, 6 * kMebibyte + 1, 25 * kMebibyte, 57995799, 3 * 25 * kMebibyte};

        for (const auto part_size : part_sizes)
        {
            for (const auto total : totals)
            {
                std::vector<PartSpan> parts;
                TransferError error;
                assert(plan_parts(total, part_size, kDefaultUploadBounds, parts, error));
                assert(parts.size() == (total + part_size - 1) / part_size);
                assert_tiles(parts, 0, total, part_size);
            }
        }
    }

    void test_plan_empty_file()
    {
        std::vector<PartSpan> parts;
        TransferError error;
        assert(plan_parts(0, 6 * kMebibyte, kDefaultUploadBounds, parts, error));
        assert(parts.size() == 1);
        assert(parts[0] == (PartSpan{.index = 1, .offset = 0, .length = 0}));
    }

    void test_plan_scenarios()
    {
        std::vector<PartSpan> parts;
        TransferError error;
        assert(plan_parts(11, kDefaultUploadBounds.min_part_size, kDefaultUploadBounds, parts, error));
        assert(parts.size() == 1);
        assert(parts[0] == (PartSpan{.index = 1, .offset = 0, .length = 11}));

        assert(plan_parts(57995799, 10 * kMebibyte, kDefaultUploadBounds, parts, error));
        assert(parts.size() == 6);
        assert(parts.back().length == 57995799 - 5 * 10485760);
        assert(parts.back().offset == 5 * 10485760);
    }

    void test_part_size_bounds()
    {
        TransferError error;
        assert(validate_part_size(kDefaultUploadBounds.min_part_size, kDefaultUploadBounds, error));
        assert(validate_part_size(kDefaultUploadBounds.max_part_size, kDefaultUploadBounds, error));

        assert(!validate_part_size(kDefaultUploadBounds.min_part_size - 1, kDefaultUploadBounds, error));
        assert(error.code == ErrorCode::InvalidPartSize);
        error = {};
        assert(!validate_part_size(kDefaultUploadBounds.max_part_size + 1, kDefaultUploadBounds, error));
        assert(error.code == ErrorCode::InvalidPartSize);

        std::vector<PartSpan> parts;
        error = {};
        assert(!plan_parts(100, 0, PartSizeBounds{.min_part_size = 0, .max_part_size = 10}, parts, error));
        assert(error.code == ErrorCode::InvalidPartSize);

        const PartSizeBounds tight{.min_part_size = 1, .max_part_size = 100, .max_part_count = 4};
        error = {};
        assert(plan_parts(4, 1, tight, parts, error));
        assert(parts.size() == 4);
        assert(!plan_parts(5, 1, tight, parts, error));
        assert(error.code == ErrorCode::InvalidPartSize);
    }

    void test_byte_range_validation()
    {
        ByteRange range;
        TransferError error;

        assert(!validate_byte_range({1000, 1}, kDefaultMaxRangeSize, range, error));
        assert(error.code == ErrorCode::ByteRange);

        error = {};
        assert(!validate_byte_range({1000}, kDefaultMaxRangeSize, range, error));
        assert(error.code == ErrorCode::ByteRange);

        error = {};
        assert(!validate_byte_range({1, 10000001}, kDefaultMaxRangeSize, range, error));
        assert(error.code == ErrorCode::ByteRange);

        error = {};
        assert(!validate_byte_range({0, std::numeric_limits<std::uint64_t>::max()}, kDefaultMaxRangeSize, range,
                                    error));
        assert(error.code == ErrorCode::ByteRange);

        error = {};
        assert(!validate_byte_range({1, 2, 3}, kDefaultMaxRangeSize, range, error));
        assert(error.code == ErrorCode::ByteRange);

        error = {};
        assert(validate_byte_range({1, 10000000}, kDefaultMaxRangeSize, range, error));
        assert(range == (ByteRange{.first = 1, .last = 10000000}));
        assert(range.length() == 10000000);

        assert(validate_byte_range({7, 7}, kDefaultMaxRangeSize, range, error));
        assert(range.length() == 1);
    }

    void test_plan_range_offsets()
    {
        const ByteRange range{.first = 100, .last = 100 + 2 * kMebibyte + kMebibyte / 2 - 1};
        std::vector<PartSpan> parts;
        TransferError error;
        assert(plan_range(range, kMebibyte, kDefaultDownloadBounds, parts, error));
        assert(parts.size() == 3);
        assert_tiles(parts, range.first, range.length(), kMebibyte);
        assert(parts.back().length == kMebibyte / 2);

        const ByteRange whole{.first = 0, .last = std::numeric_limits<std::uint64_t>::max()};
        error = {};
        assert(!plan_range(whole, kMebibyte, kDefaultDownloadBounds, parts, error));
        assert(error.code == ErrorCode::ByteRange);
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);
        assert(chunk_hash == crypto::hash_string(std::string("\xDE\xAD\xBE\xEF", 4)));

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_stream(stream) == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "chunkdrive_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);

        bool threw = false;
        try
        {
            crypto::hash_file(file_path.string() + ".missing");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        std::filesystem::remove(file_path);
    }

    void test_remote_file_json()
    {
        RemoteFile file{
            .id = "4242",
            .name = "reads.fastq",
            .path = "/samples/reads.fastq",
            .size = 57995799,
            .content_type = "application/octet-stream",
            .upload_status = UploadStatus::Complete,
            .content_digest = std::string("abcd"),
        };
        const auto wrapped = wrap_response(file);
        assert(wrapped.contains("Response"));
        assert(wrapped["Response"]["UploadStatus"] == "complete");

        const auto decoded = unwrap_response(wrapped).get<RemoteFile>();
        assert(decoded.id == file.id);
        assert(decoded.path == file.path);
        assert(decoded.size == file.size);
        assert(decoded.upload_status == UploadStatus::Complete);
        assert(decoded.content_digest == file.content_digest);

        const auto minimal = nlohmann::json{{"Id", "7"}, {"Name", "a.txt"}, {"UploadStatus", "pending"}}.get<RemoteFile>();
        assert(minimal.path == "a.txt");
        assert(minimal.upload_status == UploadStatus::Pending);
        assert(!minimal.content_digest);

        bool threw = false;
        try
        {
            (void)nlohmann::json{{"Id", "7"}, {"UploadStatus", "sideways"}}.get<RemoteFile>();
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_completion_payload()
    {
        CompleteUploadRequest request{.parts = {
                                          PartToken{.part_number = 1, .etag = "a"},
                                          PartToken{.part_number = 2, .etag = "b"},
                                      }};
        const auto json = nlohmann::json(request);
        assert(json["Parts"].size() == 2);
        assert(json["Parts"][1]["PartNumber"] == 2);
        assert(json["Parts"][1]["ETag"] == "b");
        assert(json.get<CompleteUploadRequest>().parts == request.parts);

        const auto ack = nlohmann::json{{"ETag", "etag-1"}}.get<PartAck>();
        assert(ack.etag == "etag-1");
        assert(!ack.content_digest);
    }

    void test_error_bodies()
    {
        const auto body = nlohmann::json{{"ResponseStatus", {{"ErrorCode", "Forbidden"}, {"Message", "no access"}}}};
        assert(describe_error_body(body.dump()) == "Forbidden: no access");
        assert(describe_error_body("gateway exploded") == "gateway exploded");

        bool threw = false;
        try
        {
            (void)unwrap_response(body);
        }
        catch (const nlohmann::json::exception &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

int main()
{
    try
    {
        test_error_codes();
        test_plan_tiles_every_size();
        test_plan_empty_file();
        test_plan_scenarios();
        test_part_size_bounds();
        test_byte_range_validation();
        test_plan_range_offsets();
        test_crypto();
        test_remote_file_json();
        test_completion_payload();
        test_error_bodies();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
