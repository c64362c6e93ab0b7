#include "chunkdrive/client/integrity.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::client
{

    namespace
    {

        std::string normalize_digest(std::string digest)
        {
            std::transform(digest.begin(), digest.end(), digest.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return digest;
        }

        bool compare(const std::string &expected, const std::string &actual, const std::string &subject,
                     std::optional<std::uint32_t> part_index, TransferError &error)
        {
            if (normalize_digest(expected) == actual)
            {
                return true;
            }
            error = make_error(ErrorCode::Integrity,
                               subject + " digest mismatch: expected " + expected + ", computed " + actual,
                               part_index);
            return false;
        }

    } // namespace

    bool verify_part(const std::optional<std::string> &expected_digest, const Part &part, TransferError &error)
    {
        if (!expected_digest || expected_digest->empty())
        {
            return true;
        }
        return compare(*expected_digest, part.checksum, "Part " + std::to_string(part.index), part.index, error);
    }

    bool verify_whole_file(const std::optional<std::string> &expected_digest, const std::filesystem::path &path,
                           std::string &computed, TransferError &error)
    {
        try
        {
            computed = crypto::hash_file(path);
        }
        catch (const std::runtime_error &ex)
        {
            error = make_error(ErrorCode::IO, ex.what());
            return false;
        }
        if (!expected_digest || expected_digest->empty())
        {
            return true;
        }
        return compare(*expected_digest, computed, "File " + path.filename().string(), std::nullopt, error);
    }

    bool verify_whole_bytes(const std::string &expected_digest, std::span<const std::byte> bytes,
                            TransferError &error)
    {
        return compare(expected_digest, crypto::hash_bytes(bytes), "Content", std::nullopt, error);
    }

} // namespace chunkdrive::client
