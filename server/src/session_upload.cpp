#include "ftecho/server/session.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "ftecho/error_codes.hpp"

#include <spdlog/spdlog.h>

namespace ftecho::server
{

    namespace
    {

        std::string unexpected(const char *expected, ftecho::protocol::FrameType got)
        {
            return std::string("Expected '") + expected + "' chunk, got '" + ftecho::protocol::to_char(got) + "'";
        }

    } // namespace

    void Session::handle_put(const ftecho::protocol::Frame &frame)
    {
        ftecho::protocol::PutRequest request;
        try
        {
            request = ftecho::protocol::parse_put_request(frame.text());
        }
        catch (const ftecho::TransferError &ex)
        {
            send_error(std::string("Invalid metadata: ") + ex.what());
            return;
        }

        try
        {
            Storage::validate_name(request.filename);
            upload_.emplace(UploadTransfer{
                .filename = request.filename,
                .file = services_.storage.open_staged_for_write(request.filename, false),
                .declared_size = request.size,
            });
        }
        catch (const std::exception &ex)
        {
            upload_.reset();
            send_error(ex.what());
            return;
        }

        spdlog::info("{}: PUT {} ({} bytes)", remote_endpoint(), request.filename, request.size);
        state_ = State::ReceivingUpload;
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, ftecho::protocol::kReadyMessage, [this, self]
                  {
                      if (upload_->declared_size == 0)
                      {
                          read_frame([this](ftecho::protocol::Frame next)
                                     { receive_upload_checksum(std::move(next)); });
                          return;
                      }
                      read_frame([this](ftecho::protocol::Frame next)
                                 { receive_upload_frame(std::move(next)); }); });
    }

    void Session::handle_put_resume(const std::string &filename, std::uint64_t offset)
    {
        try
        {
            Storage::validate_name(filename);
            const auto staged = services_.storage.staged_size(filename);
            if (!staged)
            {
                throw StorageError(ftecho::ErrorCode::NotFound, "No partial file found for resume: " + filename);
            }
            if (*staged != offset)
            {
                throw StorageError(ftecho::ErrorCode::OffsetMismatch, "Offset mismatch: expected " +
                                                                          std::to_string(*staged) + ", got " +
                                                                          std::to_string(offset));
            }

            UploadTransfer transfer{
                .filename = filename,
                .received = offset,
                .resumed = true,
            };
            {
                auto existing = services_.storage.open_staged_for_read(filename);
                if (ftecho::crypto::update_from_stream(transfer.hasher, existing, offset) != offset)
                {
                    throw StorageError(ftecho::ErrorCode::IoError, "Partial file for " + filename + " changed while resuming");
                }
            }
            transfer.file = services_.storage.open_staged_for_write(filename, true);
            upload_.emplace(std::move(transfer));
        }
        catch (const std::exception &ex)
        {
            upload_.reset();
            send_error(ex.what());
            return;
        }

        spdlog::info("{}: PUT RESUME {} from offset {}", remote_endpoint(), filename, offset);
        const nlohmann::json ack = ftecho::protocol::ResumeAck{.offset = offset, .ready = true};
        state_ = State::ReceivingResumedUpload;
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, ack.dump(), [this, self]
                  { read_frame([this](ftecho::protocol::Frame next)
                               { receive_resumed_upload_frame(std::move(next)); }); });
    }

    void Session::receive_upload_frame(ftecho::protocol::Frame frame)
    {
        auto &transfer = *upload_;
        if (frame.type != ftecho::protocol::FrameType::FileData)
        {
            abort_upload(unexpected("F", frame.type));
            return;
        }
        if (transfer.received + frame.payload.size() > transfer.declared_size)
        {
            abort_upload_stream("Size mismatch: expected " + std::to_string(transfer.declared_size) + ", received " +
                                std::to_string(transfer.received + frame.payload.size()));
            return;
        }
        try
        {
            write_upload_chunk(frame.payload);
        }
        catch (const std::exception &ex)
        {
            abort_upload_stream(ex.what());
            return;
        }

        if (transfer.received == transfer.declared_size)
        {
            read_frame([this](ftecho::protocol::Frame next)
                       { receive_upload_checksum(std::move(next)); });
            return;
        }
        read_frame([this](ftecho::protocol::Frame next)
                   { receive_upload_frame(std::move(next)); });
    }

    void Session::receive_upload_checksum(ftecho::protocol::Frame frame)
    {
        if (frame.type == ftecho::protocol::FrameType::FileData)
        {
            abort_upload_stream("Size mismatch: expected " + std::to_string(upload_->declared_size) + ", received " +
                                std::to_string(upload_->received + frame.payload.size()));
            return;
        }
        if (frame.type != ftecho::protocol::FrameType::Checksum)
        {
            abort_upload(unexpected("S", frame.type));
            return;
        }
        commit_upload(ftecho::protocol::trim(frame.text()));
    }

    void Session::receive_resumed_upload_frame(ftecho::protocol::Frame frame)
    {
        switch (frame.type)
        {
        case ftecho::protocol::FrameType::FileData:
            try
            {
                write_upload_chunk(frame.payload);
            }
            catch (const std::exception &ex)
            {
                abort_upload_stream(ex.what());
                return;
            }
            read_frame([this](ftecho::protocol::Frame next)
                       { receive_resumed_upload_frame(std::move(next)); });
            break;
        case ftecho::protocol::FrameType::Checksum:
            commit_upload(ftecho::protocol::trim(frame.text()));
            break;
        default:
            abort_upload(std::string("Unexpected message type: ") + ftecho::protocol::to_char(frame.type));
            break;
        }
    }

    void Session::write_upload_chunk(const std::vector<std::uint8_t> &data)
    {
        auto &transfer = *upload_;
        transfer.file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!transfer.file)
        {
            throw StorageError(ftecho::ErrorCode::IoError, "Failed to write staging file for " + transfer.filename);
        }
        transfer.hasher.update(data);
        transfer.received += data.size();
    }

    void Session::commit_upload(const std::string &client_digest)
    {
        auto &transfer = *upload_;
        std::string digest;
        std::string failure;
        try
        {
            transfer.file.flush();
            const bool flushed = static_cast<bool>(transfer.file);
            transfer.file.close();
            if (!flushed)
            {
                throw StorageError(ftecho::ErrorCode::IoError, "Failed to flush staging file for " + transfer.filename);
            }
            digest = transfer.hasher.final_hex();
            if (!ftecho::crypto::is_hex_digest(client_digest))
            {
                failure = "Invalid checksum: '" + client_digest + "'";
            }
            else if (digest != client_digest)
            {
                failure = "Checksum mismatch: server=" + digest + ", client=" + client_digest;
            }
            else
            {
                services_.storage.commit(transfer.filename);
            }
        }
        catch (const std::exception &ex)
        {
            failure = ex.what();
        }
        if (!failure.empty())
        {
            abort_upload(failure);
            return;
        }

        spdlog::info("{}: {} completed: {}, size={}, sha={}", remote_endpoint(),
                     transfer.resumed ? "PUT RESUME" : "PUT", transfer.filename, transfer.received, digest);
        upload_.reset();
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, digest, [this, self]
                  { await_command(); });
    }

    std::string Session::discard_upload(const std::string &reason)
    {
        const auto filename = upload_->filename;
        const bool resumed = upload_->resumed;
        upload_.reset();
        if (!resumed && !services_.storage.discard_staged(filename))
        {
            spdlog::warn("{}: could not remove staging file for {}", remote_endpoint(), filename);
        }
        return (resumed ? "PUT RESUME failed: " : "PUT failed: ") + reason;
    }

    void Session::abort_upload(const std::string &reason)
    {
        send_error(discard_upload(reason));
    }

    void Session::abort_upload_stream(const std::string &reason)
    {
        drain_error_ = discard_upload(reason);
        drained_bytes_ = 0;
        state_ = State::DrainingUpload;
        read_frame([this](ftecho::protocol::Frame next)
                   { drain_upload_frame(std::move(next)); });
    }

    // The E reply waits until the client stops streaming so that it is the next frame it reads.
    void Session::drain_upload_frame(ftecho::protocol::Frame frame)
    {
        if (frame.type == ftecho::protocol::FrameType::FileData)
        {
            drained_bytes_ += frame.payload.size();
            read_frame([this](ftecho::protocol::Frame next)
                       { drain_upload_frame(std::move(next)); });
            return;
        }
        spdlog::debug("{}: discarded {} bytes of a failed upload", remote_endpoint(), drained_bytes_);
        auto message = std::move(drain_error_);
        drain_error_.clear();
        send_error(std::move(message));
    }

} // namespace ftecho::server
