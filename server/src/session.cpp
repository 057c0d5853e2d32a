#include "ftecho/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "ftecho/error_codes.hpp"

#include <spdlog/spdlog.h>

namespace ftecho::server
{

    namespace
    {

        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), endpoint_(describe_endpoint(socket_)) {}

    Session::~Session()
    {
        if (state_ != State::Closed)
        {
            stop();
        }
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        await_command();
    }

    void Session::stop()
    {
        if (state_ == State::Closed)
        {
            return;
        }
        if (upload_)
        {
            spdlog::info("{}: upload of {} interrupted at {} bytes, staging file kept", remote_endpoint(),
                         upload_->filename, upload_->received);
        }
        state_ = State::Closed;
        download_.reset();
        upload_.reset();
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::info("Client {} connection closed", remote_endpoint());
    }

    void Session::read_frame(FrameHandler handler)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self, handler = std::move(handler)](const std::error_code &ec,
                                                                    std::size_t /*bytes_transferred*/) mutable
                         {
                             if (ec)
                             {
                                 if (ec == asio::error::eof)
                                 {
                                     spdlog::info("Client {} disconnected", remote_endpoint());
                                 }
                                 else if (ec != asio::error::operation_aborted)
                                 {
                                     spdlog::warn("Read error from {}: {}", remote_endpoint(), ec.message());
                                 }
                                 stop();
                                 return;
                             }
                             std::uint32_t length = 0;
                             try
                             {
                                 length = ftecho::protocol::decode_length(header_buffer_);
                             }
                             catch (const ftecho::TransferError &ex)
                             {
                                 spdlog::error("Framing error from {}: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             read_frame_body(length, std::move(handler));
                         });
    }

    void Session::read_frame_body(std::uint32_t length, FrameHandler handler)
    {
        body_buffer_.resize(length);
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(body_buffer_),
                         [this, self, handler = std::move(handler)](const std::error_code &ec,
                                                                    std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 if (ec != asio::error::operation_aborted)
                                 {
                                     spdlog::warn("Connection from {} lost mid-frame: {}", remote_endpoint(),
                                                  ec.message());
                                 }
                                 stop();
                                 return;
                             }
                             try
                             {
                                 auto frame = ftecho::protocol::decode_body(body_buffer_);
                                 spdlog::debug("{} -> {} ({} bytes)", remote_endpoint(),
                                               ftecho::protocol::to_string(frame.type), frame.payload.size());
                                 handler(std::move(frame));
                             }
                             catch (const std::exception &ex)
                             {
                                 spdlog::error("Dropping connection {} after internal error: {}", remote_endpoint(),
                                               ex.what());
                                 stop();
                             }
                         });
    }

    void Session::send_frame(ftecho::protocol::FrameType type, std::vector<std::uint8_t> payload, Continuation next)
    {
        auto frame = std::make_shared<std::vector<std::uint8_t>>(ftecho::protocol::encode_frame(type, payload));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame, next = std::move(next)](const std::error_code &ec,
                                                                      std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  if (ec != asio::error::operation_aborted)
                                  {
                                      spdlog::warn("Write to {} failed: {}", remote_endpoint(), ec.message());
                                  }
                                  stop();
                                  return;
                              }
                              if (next && state_ != State::Closed)
                              {
                                  next();
                              }
                          });
    }

    void Session::send_text(ftecho::protocol::FrameType type, std::string_view text, Continuation next)
    {
        send_frame(type, std::vector<std::uint8_t>(text.begin(), text.end()), std::move(next));
    }

    void Session::send_error(std::string message)
    {
        spdlog::warn("{}: {}", remote_endpoint(), message);
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Error, message, [this, self]
                  { await_command(); });
    }

    void Session::await_command()
    {
        state_ = State::AwaitCommand;
        auto self = shared_from_this();
        read_frame([this, self](ftecho::protocol::Frame frame)
                   { dispatch(std::move(frame)); });
    }

    void Session::dispatch(ftecho::protocol::Frame frame)
    {
        using ftecho::protocol::FrameType;

        state_ = State::Dispatching;
        switch (frame.type)
        {
        case FrameType::List:
            handle_list();
            break;
        case FrameType::Get:
            handle_get(ftecho::protocol::trim(frame.text()));
            break;
        case FrameType::Put:
            handle_put(frame);
            break;
        case FrameType::Resume:
            handle_resume(frame);
            break;
        case FrameType::Quit:
            handle_quit();
            break;
        case FrameType::Checksum:
            send_error("Unexpected checksum message");
            break;
        default:
            send_error(std::string("Unknown message type: ") + ftecho::protocol::to_char(frame.type));
            break;
        }
    }

    void Session::handle_resume(const ftecho::protocol::Frame &frame)
    {
        ftecho::protocol::ResumeRequest request;
        try
        {
            request = ftecho::protocol::parse_resume_request(frame.text());
        }
        catch (const ftecho::TransferError &ex)
        {
            send_error(std::string("Invalid RESUME format: ") + ex.what());
            return;
        }

        const auto direction = ftecho::protocol::direction_from_string(request.direction);
        if (!direction)
        {
            send_error("Invalid direction: " + request.direction);
            return;
        }
        if (*direction == ftecho::protocol::Direction::Get)
        {
            handle_get_resume(request.filename, request.offset);
        }
        else
        {
            handle_put_resume(request.filename, request.offset);
        }
    }

    void Session::handle_quit()
    {
        spdlog::info("Client {} requested QUIT", remote_endpoint());
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, ftecho::protocol::kGoodbyeMessage, [this, self]
                  { stop(); });
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_;
    }

} // namespace ftecho::server
