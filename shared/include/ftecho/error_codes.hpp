/**
 * FT-Echo - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ftecho
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        FramingError = 1,
        ConnectionClosed = 2,
        ProtocolError = 3,
        NotFound = 4,
        SizeMismatch = 5,
        OffsetMismatch = 6,
        ChecksumMismatch = 7,
        MetadataParseError = 8,
        InvalidName = 9,
        NotConnected = 10,
        IoError = 11,
        RemoteError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    /// Raised by the codec, the client driver and the transfer handlers. The message is
    /// user-displayable as is.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ftecho
