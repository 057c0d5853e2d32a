#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ftecho/client/logger.hpp"
#include "ftecho/framing.hpp"
#include "ftecho/protocol.hpp"

namespace ftecho::client
{

    struct TransferResult
    {
        std::string digest;
        // Bytes carried by F frames in this exchange (excludes a resumed prefix).
        std::uint64_t bytes{};
        // Size of the complete file on the receiving side after the transfer.
        std::uint64_t total_size{};
    };

    /// Blocking FT-Echo client driver. Holds at most one connection and runs one command at a
    /// time; every failure is reported as ftecho::TransferError.
    class Client
    {
    public:
        explicit Client(Logger logger = Logger{});
        ~Client();

        Client(const Client &) = delete;
        Client &operator=(const Client &) = delete;

        void connect(const std::string &host, std::uint16_t port);

        bool is_connected() const noexcept;

        void close() noexcept;

        std::vector<ftecho::protocol::ListingEntry> list();

        TransferResult get(const std::string &filename, const std::filesystem::path &destination, bool resume = false,
                           std::uint64_t offset = 0);

        TransferResult put(const std::filesystem::path &source, bool resume = false, std::uint64_t offset = 0);

        /// Best effort: sends Q, reads the reply, closes the connection whatever happens.
        void quit() noexcept;

    private:
        void ensure_connected() const;
        void send_frame(ftecho::protocol::FrameType type, std::span<const std::uint8_t> payload);
        void send_text(ftecho::protocol::FrameType type, std::string_view text);
        ftecho::protocol::Frame receive_frame();
        /// Reads the next frame and returns it if it is O; E becomes RemoteError, anything else ProtocolError.
        ftecho::protocol::Frame expect_ok(std::string_view operation);

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        Logger logger_;
        std::string peer_;
    };

    // One-shot helpers: connect, run a single operation, close.

    std::vector<ftecho::protocol::ListingEntry> list_files(const std::string &host, std::uint16_t port);

    /// With `resume` set the offset is the current size of `destination` (0 if absent).
    TransferResult get_file(const std::string &host, std::uint16_t port, const std::string &filename,
                            const std::filesystem::path &destination, bool resume = false);

    TransferResult put_file(const std::string &host, std::uint16_t port, const std::filesystem::path &source,
                            bool resume = false, std::uint64_t offset = 0);

    /// `direction` is "get" (`path` is the local destination, defaults to `filename`) or "put"
    /// (`path` is the local source and is required).
    TransferResult resume_file(const std::string &host, std::uint16_t port, const std::string &filename,
                               std::uint64_t offset, std::string_view direction, const std::filesystem::path &path = {});

} // namespace ftecho::client
