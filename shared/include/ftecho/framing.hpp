/**
 * FT-Echo - Length-prefixed typed frame codec.
 *
 * Wire layout: LENGTH (4 bytes, big-endian, counts TYPE + PAYLOAD, >= 1) | TYPE (1 byte) | PAYLOAD.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ftecho::protocol
{

    enum class FrameType : std::uint8_t
    {
        List = 'L',
        Get = 'G',
        Put = 'P',
        Resume = 'R',
        Checksum = 'S',
        Ok = 'O',
        Error = 'E',
        Quit = 'Q',
        FileData = 'F'
    };

    constexpr std::size_t kHeaderSize = sizeof(std::uint32_t);

    // Upper bound accepted by decoders; file chunks never exceed kChunkSize.
    constexpr std::uint32_t kMaxFrameLength = 64u * 1024u * 1024u;

    std::string_view to_string(FrameType type) noexcept;

    bool is_known(FrameType type) noexcept;

    constexpr char to_char(FrameType type) noexcept
    {
        return static_cast<char>(type);
    }

    struct Frame
    {
        FrameType type{};
        std::vector<std::uint8_t> payload;

        std::string text() const;
    };

    struct DecodedFrame
    {
        Frame frame;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(FrameType type, std::span<const std::uint8_t> payload);

    std::vector<std::uint8_t> encode_frame(FrameType type, std::string_view payload);

    /// Validates a length header and returns the number of bytes (type + payload) that follow it.
    /// Throws TransferError(FramingError) for a zero or oversized length.
    std::uint32_t decode_length(std::span<const std::uint8_t, kHeaderSize> header);

    /// Builds a frame from the `length` bytes that follow the header.
    Frame decode_body(std::span<const std::uint8_t> body);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace ftecho::protocol
