#include "ftecho/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "ftecho/error_codes.hpp"

namespace ftecho::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t, kHeaderSize> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kHeaderSize> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        constexpr std::array<FrameType, 9> kKnownTypes{
            FrameType::List,
            FrameType::Get,
            FrameType::Put,
            FrameType::Resume,
            FrameType::Checksum,
            FrameType::Ok,
            FrameType::Error,
            FrameType::Quit,
            FrameType::FileData,
        };
    } // namespace

    std::string_view to_string(FrameType type) noexcept
    {
        switch (type)
        {
        case FrameType::List:
            return "LIST";
        case FrameType::Get:
            return "GET";
        case FrameType::Put:
            return "PUT";
        case FrameType::Resume:
            return "RESUME";
        case FrameType::Checksum:
            return "CHECKSUM";
        case FrameType::Ok:
            return "OK";
        case FrameType::Error:
            return "ERROR";
        case FrameType::Quit:
            return "QUIT";
        case FrameType::FileData:
            return "FILE_DATA";
        }
        return "UNKNOWN";
    }

    bool is_known(FrameType type) noexcept
    {
        return std::find(kKnownTypes.begin(), kKnownTypes.end(), type) != kKnownTypes.end();
    }

    std::string Frame::text() const
    {
        return std::string(payload.begin(), payload.end());
    }

    std::vector<std::uint8_t> encode_frame(FrameType type, std::span<const std::uint8_t> payload)
    {
        if (payload.size() >= std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("Payload too large to frame");
        }
        const auto length = static_cast<std::uint32_t>(payload.size() + 1);
        std::vector<std::uint8_t> frame(kHeaderSize + length);
        write_u32_be(length, std::span<std::uint8_t>(frame).first<kHeaderSize>());
        frame[kHeaderSize] = static_cast<std::uint8_t>(type);
        std::copy(payload.begin(), payload.end(), frame.begin() + static_cast<std::ptrdiff_t>(kHeaderSize + 1));
        return frame;
    }

    std::vector<std::uint8_t> encode_frame(FrameType type, std::string_view payload)
    {
        return encode_frame(type, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(payload.data()),
                                                                payload.size()));
    }

    std::uint32_t decode_length(std::span<const std::uint8_t, kHeaderSize> header)
    {
        const auto length = read_u32_be(header);
        if (length < 1)
        {
            throw TransferError(ErrorCode::FramingError, "Invalid message length: 0");
        }
        if (length > kMaxFrameLength)
        {
            throw TransferError(ErrorCode::FramingError, "Invalid message length: " + std::to_string(length));
        }
        return length;
    }

    Frame decode_body(std::span<const std::uint8_t> body)
    {
        if (body.empty())
        {
            throw TransferError(ErrorCode::FramingError, "Frame body is missing its type byte");
        }
        Frame frame;
        frame.type = static_cast<FrameType>(body[0]);
        frame.payload.assign(body.begin() + 1, body.end());
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kHeaderSize)
        {
            return std::nullopt;
        }
        const auto length = decode_length(buffer.first<kHeaderSize>());
        if (buffer.size() < kHeaderSize + length)
        {
            return std::nullopt;
        }
        DecodedFrame result{
            .frame = decode_body(buffer.subspan(kHeaderSize, length)),
            .bytes_consumed = kHeaderSize + length,
        };
        return result;
    }

} // namespace ftecho::protocol
