#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftecho/crypto.hpp"
#include "ftecho/framing.hpp"
#include "ftecho/protocol.hpp"
#include "ftecho/server/storage.hpp"

namespace ftecho::server
{

    struct ServerServices
    {
        Storage &storage;
    };

    /// One accepted connection. Commands are served strictly one at a time: the next command
    /// frame is read only after the previous exchange wrote its terminal frame.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        enum class State : std::uint8_t
        {
            AwaitCommand,
            Dispatching,
            SendingFile,
            ReceivingUpload,
            ReceivingResumedUpload,
            DrainingUpload,
            Closed
        };

        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        using FrameHandler = std::function<void(ftecho::protocol::Frame)>;
        using Continuation = std::function<void()>;

        // Wire I/O
        void read_frame(FrameHandler handler);
        void read_frame_body(std::uint32_t length, FrameHandler handler);
        void send_frame(ftecho::protocol::FrameType type, std::vector<std::uint8_t> payload, Continuation next);
        void send_text(ftecho::protocol::FrameType type, std::string_view text, Continuation next);
        void send_error(std::string message);
        void await_command();
        void dispatch(ftecho::protocol::Frame frame);

        // Command handlers
        void handle_list();
        void handle_get(const std::string &filename);
        void handle_resume(const ftecho::protocol::Frame &frame);
        void handle_get_resume(const std::string &filename, std::uint64_t offset);
        void handle_put(const ftecho::protocol::Frame &frame);
        void handle_put_resume(const std::string &filename, std::uint64_t offset);
        void handle_quit();

        // GET / GET-RESUME streaming
        void begin_download(const std::string &filename, std::uint64_t offset);
        void send_next_chunk();
        void finish_download();

        // PUT / PUT-RESUME reception
        void receive_upload_frame(ftecho::protocol::Frame frame);
        void receive_upload_checksum(ftecho::protocol::Frame frame);
        void receive_resumed_upload_frame(ftecho::protocol::Frame frame);
        void write_upload_chunk(const std::vector<std::uint8_t> &data);
        void commit_upload(const std::string &client_digest);
        // Releases the upload and returns the E text. A fresh PUT drops its staging file; a resumed one keeps it.
        std::string discard_upload(const std::string &reason);
        // For failures once the client has finished streaming: replies E at once.
        void abort_upload(const std::string &reason);
        // For failures while F frames may still be in flight: swallows them up to the S trailer, then replies E.
        void abort_upload_stream(const std::string &reason);
        void drain_upload_frame(ftecho::protocol::Frame frame);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_;
        State state_{State::AwaitCommand};

        std::array<std::uint8_t, ftecho::protocol::kHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> body_buffer_;

        struct DownloadTransfer
        {
            std::string filename;
            std::ifstream file;
            std::uint64_t size{};
            std::uint64_t offset{};
            std::uint64_t sent{};
            ftecho::crypto::Sha256 hasher;
        };
        std::optional<DownloadTransfer> download_;

        struct UploadTransfer
        {
            std::string filename;
            std::ofstream file;
            std::uint64_t declared_size{};
            std::uint64_t received{};
            ftecho::crypto::Sha256 hasher;
            bool resumed{};
        };
        std::optional<UploadTransfer> upload_;
        std::string drain_error_;
        std::uint64_t drained_bytes_{};
    };

} // namespace ftecho::server
