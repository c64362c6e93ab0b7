/**
 * ChunkDrive - Error taxonomy shared by the planner, the workers and the caller surface.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPartSize = 1,
        ByteRange = 2,
        TransferTransient = 3,
        TransferPermanent = 4,
        Integrity = 5,
        Finalization = 6,
        IO = 7,
        Cancelled = 8,
        NotFound = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Only transient transfer failures are worth another attempt.
    constexpr bool is_retryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::TransferTransient;
    }

    struct TransferError
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};
        std::optional<std::uint32_t> part_index{};

        explicit operator bool() const noexcept
        {
            return code != ErrorCode::Ok;
        }
    };

    TransferError make_error(ErrorCode code, std::string message,
                             std::optional<std::uint32_t> part_index = std::nullopt);

    std::string describe(const TransferError &error);

} // namespace chunkdrive
