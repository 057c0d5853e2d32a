#include "ftecho/client/client.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <filesystem>
#include <system_error>

#include "ftecho/error_codes.hpp"

namespace ftecho::client
{

    Client::Client(Logger logger)
        : socket_(io_context_),
          logger_(std::move(logger)) {}

    Client::~Client()
    {
        close();
    }

    void Client::connect(const std::string &host, std::uint16_t port)
    {
        close();
        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port), ec);
        if (!ec)
        {
            asio::connect(socket_, results, ec);
        }
        if (ec)
        {
            close();
            logger_.log("connect", "failed ", host, ':', port, ": ", ec.message());
            throw ftecho::TransferError(ftecho::ErrorCode::IoError,
                                        "Failed to connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
        }
        peer_ = host + ":" + std::to_string(port);
        logger_.log("connect", "connected to ", peer_);
    }

    bool Client::is_connected() const noexcept
    {
        return socket_.is_open();
    }

    void Client::close() noexcept
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        logger_.log("connect", "closed connection to ", peer_);
    }

    std::vector<ftecho::protocol::ListingEntry> Client::list()
    {
        ensure_connected();
        send_text(ftecho::protocol::FrameType::List, "");
        const auto reply = expect_ok("list");
        auto entries = ftecho::protocol::parse_listing(reply.text());
        logger_.log("list", entries.size(), " files");
        return entries;
    }

    void Client::quit() noexcept
    {
        if (!is_connected())
        {
            return;
        }
        try
        {
            send_text(ftecho::protocol::FrameType::Quit, "");
            const auto reply = receive_frame();
            logger_.log("quit", "server replied ", ftecho::protocol::to_char(reply.type), ' ', reply.text());
        }
        catch (const std::exception &ex)
        {
            logger_.log("quit", "ignored failure: ", ex.what());
        }
        close();
    }

    void Client::ensure_connected() const
    {
        if (!is_connected())
        {
            throw ftecho::TransferError(ftecho::ErrorCode::NotConnected, "Not connected to a server");
        }
    }

    void Client::send_frame(ftecho::protocol::FrameType type, std::span<const std::uint8_t> payload)
    {
        const auto frame = ftecho::protocol::encode_frame(type, payload);
        std::error_code ec;
        asio::write(socket_, asio::buffer(frame), ec);
        if (ec)
        {
            close();
            throw ftecho::TransferError(ftecho::ErrorCode::ConnectionClosed, "Connection lost: " + ec.message());
        }
    }

    void Client::send_text(ftecho::protocol::FrameType type, std::string_view text)
    {
        send_frame(type, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
    }

    ftecho::protocol::Frame Client::receive_frame()
    {
        std::array<std::uint8_t, ftecho::protocol::kHeaderSize> header{};
        std::error_code ec;
        asio::read(socket_, asio::buffer(header), ec);
        if (!ec)
        {
            std::uint32_t length = 0;
            try
            {
                length = ftecho::protocol::decode_length(header);
            }
            catch (const ftecho::TransferError &)
            {
                close();
                throw;
            }
            std::vector<std::uint8_t> body(length);
            asio::read(socket_, asio::buffer(body), ec);
            if (!ec)
            {
                return ftecho::protocol::decode_body(body);
            }
        }
        close();
        if (ec == asio::error::eof)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::ConnectionClosed, "Connection closed");
        }
        throw ftecho::TransferError(ftecho::ErrorCode::ConnectionClosed, "Connection lost: " + ec.message());
    }

    ftecho::protocol::Frame Client::expect_ok(std::string_view operation)
    {
        auto frame = receive_frame();
        if (frame.type == ftecho::protocol::FrameType::Ok)
        {
            return frame;
        }
        if (frame.type == ftecho::protocol::FrameType::Error)
        {
            logger_.log(std::string(operation), "server error: ", frame.text());
            throw ftecho::TransferError(ftecho::ErrorCode::RemoteError, frame.text());
        }
        close();
        throw ftecho::TransferError(ftecho::ErrorCode::ProtocolError,
                                    std::string("Unexpected response: ") + ftecho::protocol::to_char(frame.type));
    }

    std::vector<ftecho::protocol::ListingEntry> list_files(const std::string &host, std::uint16_t port)
    {
        Client client;
        client.connect(host, port);
        auto entries = client.list();
        client.close();
        return entries;
    }

    TransferResult get_file(const std::string &host, std::uint16_t port, const std::string &filename,
                            const std::filesystem::path &destination, bool resume)
    {
        std::uint64_t offset = 0;
        if (resume)
        {
            std::error_code ec;
            const auto existing = std::filesystem::file_size(destination, ec);
            offset = ec ? 0 : static_cast<std::uint64_t>(existing);
        }
        Client client;
        client.connect(host, port);
        auto result = client.get(filename, destination, resume && offset > 0, offset);
        client.close();
        return result;
    }

    TransferResult put_file(const std::string &host, std::uint16_t port, const std::filesystem::path &source,
                            bool resume, std::uint64_t offset)
    {
        Client client;
        client.connect(host, port);
        auto result = client.put(source, resume, offset);
        client.close();
        return result;
    }

    TransferResult resume_file(const std::string &host, std::uint16_t port, const std::string &filename,
                               std::uint64_t offset, std::string_view direction, const std::filesystem::path &path)
    {
        const auto parsed = ftecho::protocol::direction_from_string(direction);
        if (!parsed)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::MetadataParseError,
                                        "Invalid direction: " + std::string(direction));
        }
        if (*parsed == ftecho::protocol::Direction::Put && path.empty())
        {
            throw ftecho::TransferError(ftecho::ErrorCode::NotFound, "A local source path is required to resume a PUT");
        }
        Client client;
        client.connect(host, port);
        TransferResult result;
        if (*parsed == ftecho::protocol::Direction::Get)
        {
            result = client.get(filename, path.empty() ? std::filesystem::path(filename) : path, true, offset);
        }
        else
        {
            result = client.put(path, true, offset);
        }
        client.close();
        return result;
    }

} // namespace ftecho::client
