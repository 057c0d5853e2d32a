#include "ftecho/error_codes.hpp"

#include <array>

namespace ftecho
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::FramingError, "framing_error"},
            {ErrorCode::ConnectionClosed, "connection_closed"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::SizeMismatch, "size_mismatch"},
            {ErrorCode::OffsetMismatch, "offset_mismatch"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::MetadataParseError, "metadata_parse_error"},
            {ErrorCode::InvalidName, "invalid_name"},
            {ErrorCode::NotConnected, "not_connected"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::RemoteError, "remote_error"},
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

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace ftecho
