#include "chunkdrive/error_codes.hpp"

#include <array>
#include <utility>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidPartSize, "invalid_part_size"},
            {ErrorCode::ByteRange, "byte_range"},
            {ErrorCode::TransferTransient, "transfer_transient"},
            {ErrorCode::TransferPermanent, "transfer_permanent"},
            {ErrorCode::Integrity, "integrity"},
            {ErrorCode::Finalization, "finalization"},
            {ErrorCode::IO, "io"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::NotFound, "not_found"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::TransferPermanent;
    }

    TransferError make_error(ErrorCode code, std::string message, std::optional<std::uint32_t> part_index)
    {
        return TransferError{.code = code, .message = std::move(message), .part_index = part_index};
    }

    std::string describe(const TransferError &error)
    {
        std::string text(to_string(error.code));
        if (error.part_index)
        {
            text += " (part " + std::to_string(*error.part_index) + ")";
        }
        if (!error.message.empty())
        {
            text += ": " + error.message;
        }
        return text;
    }

} // namespace chunkdrive
