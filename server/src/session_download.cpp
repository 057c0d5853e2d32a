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

        std::uint64_t require_committed(const Storage &storage, const std::string &filename)
        {
            Storage::validate_name(filename);
            const auto size = storage.committed_size(filename);
            if (!size)
            {
                throw StorageError(ftecho::ErrorCode::NotFound, "File not found: " + filename);
            }
            return *size;
        }

    } // namespace

    void Session::handle_get(const std::string &filename)
    {
        try
        {
            begin_download(filename, 0);
        }
        catch (const std::exception &ex)
        {
            download_.reset();
            send_error(ex.what());
            return;
        }

        spdlog::info("{}: GET {} ({} bytes)", remote_endpoint(), filename, download_->size);
        const nlohmann::json info = ftecho::protocol::DownloadInfo{.size = download_->size};
        state_ = State::SendingFile;
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, info.dump(), [this, self]
                  { send_next_chunk(); });
    }

    void Session::handle_get_resume(const std::string &filename, std::uint64_t offset)
    {
        try
        {
            const auto size = require_committed(services_.storage, filename);
            if (offset >= size)
            {
                throw StorageError(ftecho::ErrorCode::OffsetMismatch,
                                   "Offset " + std::to_string(offset) + " exceeds file size " + std::to_string(size));
            }
            begin_download(filename, offset);
        }
        catch (const std::exception &ex)
        {
            download_.reset();
            send_error(ex.what());
            return;
        }

        spdlog::info("{}: GET RESUME {} from offset {} of {}", remote_endpoint(), filename, offset, download_->size);
        const nlohmann::json info = ftecho::protocol::DownloadInfo{.size = download_->size, .offset = offset};
        state_ = State::SendingFile;
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Ok, info.dump(), [this, self]
                  { send_next_chunk(); });
    }

    // The checksum sent at the end always covers the whole file, so for a resumed transfer the
    // prefix [0, offset) is hashed here without being sent.
    void Session::begin_download(const std::string &filename, std::uint64_t offset)
    {
        const auto size = require_committed(services_.storage, filename);
        download_.emplace(DownloadTransfer{
            .filename = filename,
            .file = services_.storage.open_committed(filename),
            .size = size,
            .offset = offset,
        });
        if (offset > 0)
        {
            const auto hashed = ftecho::crypto::update_from_stream(download_->hasher, download_->file, offset);
            if (hashed != offset)
            {
                throw StorageError(ftecho::ErrorCode::IoError, "File " + filename + " changed while resuming");
            }
        }
    }

    void Session::send_next_chunk()
    {
        auto &transfer = *download_;
        std::vector<std::uint8_t> chunk(ftecho::protocol::kChunkSize);
        transfer.file.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        const auto read_count = static_cast<std::size_t>(transfer.file.gcount());
        if (transfer.file.bad())
        {
            const auto filename = transfer.filename;
            download_.reset();
            send_error("Read error while sending " + filename);
            return;
        }
        if (read_count == 0)
        {
            finish_download();
            return;
        }

        chunk.resize(read_count);
        transfer.hasher.update(chunk);
        transfer.sent += read_count;
        auto self = shared_from_this();
        send_frame(ftecho::protocol::FrameType::FileData, std::move(chunk), [this, self]
                   { send_next_chunk(); });
    }

    void Session::finish_download()
    {
        auto &transfer = *download_;
        const auto digest = transfer.hasher.final_hex();
        spdlog::info("{}: GET completed: {}, offset={}, sent={}, sha={}", remote_endpoint(), transfer.filename,
                     transfer.offset, transfer.sent, digest);
        download_.reset();
        auto self = shared_from_this();
        send_text(ftecho::protocol::FrameType::Checksum, digest, [this, self]
                  { await_command(); });
    }

} // namespace ftecho::server
