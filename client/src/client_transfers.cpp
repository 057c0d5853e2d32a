#include "ftecho/client/client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include "ftecho/crypto.hpp"
#include "ftecho/error_codes.hpp"

namespace ftecho::client
{

    namespace
    {

        std::uint64_t local_size_or_zero(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            return ec ? 0 : static_cast<std::uint64_t>(size);
        }

        void check_digests(const std::string &client_digest, const std::string &server_digest)
        {
            if (client_digest != server_digest)
            {
                throw ftecho::TransferError(ftecho::ErrorCode::ChecksumMismatch,
                                            "Checksum mismatch: client=" + client_digest + ", server=" + server_digest);
            }
        }

    } // namespace

    TransferResult Client::get(const std::string &filename, const std::filesystem::path &destination, bool resume,
                               std::uint64_t offset)
    {
        ensure_connected();

        // A resumed download keeps exactly `offset` local bytes and folds them into the digest.
        ftecho::crypto::Sha256 hasher;
        std::uint64_t local_size = 0;
        if (resume)
        {
            local_size = local_size_or_zero(destination);
            if (local_size < offset)
            {
                throw ftecho::TransferError(ftecho::ErrorCode::OffsetMismatch,
                                            "Local file holds " + std::to_string(local_size) +
                                                " bytes, cannot resume at offset " + std::to_string(offset));
            }
            if (offset > 0)
            {
                std::ifstream prefix(destination, std::ios::binary);
                if (!prefix.is_open() || ftecho::crypto::update_from_stream(hasher, prefix, offset) != offset)
                {
                    throw ftecho::TransferError(ftecho::ErrorCode::IoError,
                                                "Failed to read local partial file " + destination.string());
                }
            }
        }

        if (resume)
        {
            const ftecho::protocol::ResumeRequest request{
                .filename = filename,
                .offset = offset,
                .direction = std::string(ftecho::protocol::to_string(ftecho::protocol::Direction::Get)),
            };
            send_text(ftecho::protocol::FrameType::Resume, nlohmann::json(request).dump());
        }
        else
        {
            send_text(ftecho::protocol::FrameType::Get, filename);
        }

        const auto ack = expect_ok("get");
        ftecho::protocol::DownloadInfo info;
        try
        {
            info = nlohmann::json::parse(ack.text()).get<ftecho::protocol::DownloadInfo>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            close();
            throw ftecho::TransferError(ftecho::ErrorCode::ProtocolError,
                                        std::string("Invalid download metadata: ") + ex.what());
        }
        logger_.log("get", filename, " size=", info.size, " offset=", resume ? offset : 0);

        // Local bytes past the offset are dropped only once the server has accepted the resume.
        if (resume && local_size > offset)
        {
            std::error_code ec;
            std::filesystem::resize_file(destination, offset, ec);
            if (ec)
            {
                close();
                throw ftecho::TransferError(ftecho::ErrorCode::IoError,
                                            "Failed to truncate " + destination.string() + ": " + ec.message());
            }
        }

        std::ofstream out(destination, std::ios::binary | (resume ? std::ios::app : std::ios::trunc));
        if (!out.is_open())
        {
            // The server is already streaming; the connection cannot be resynchronised.
            close();
            throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Failed to open " + destination.string());
        }

        std::uint64_t received = 0;
        std::string server_digest;
        while (true)
        {
            const auto frame = receive_frame();
            if (frame.type == ftecho::protocol::FrameType::FileData)
            {
                out.write(reinterpret_cast<const char *>(frame.payload.data()),
                          static_cast<std::streamsize>(frame.payload.size()));
                if (!out)
                {
                    close();
                    throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Failed to write " + destination.string());
                }
                hasher.update(frame.payload);
                received += frame.payload.size();
            }
            else if (frame.type == ftecho::protocol::FrameType::Checksum)
            {
                server_digest = ftecho::protocol::trim(frame.text());
                break;
            }
            else if (frame.type == ftecho::protocol::FrameType::Error)
            {
                logger_.log("get", "server error during transfer: ", frame.text());
                throw ftecho::TransferError(ftecho::ErrorCode::RemoteError, frame.text());
            }
            else
            {
                close();
                throw ftecho::TransferError(ftecho::ErrorCode::ProtocolError,
                                            std::string("Unexpected message type: ") +
                                                ftecho::protocol::to_char(frame.type));
            }
        }
        out.close();
        if (!out)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Failed to finish writing " + destination.string());
        }

        const auto client_digest = hasher.final_hex();
        logger_.log("get", filename, " received=", received, " sha=", client_digest);
        check_digests(client_digest, server_digest);
        return TransferResult{
            .digest = client_digest,
            .bytes = received,
            .total_size = (resume ? offset : 0) + received,
        };
    }

    TransferResult Client::put(const std::filesystem::path &source, bool resume, std::uint64_t offset)
    {
        ensure_connected();

        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec))
        {
            throw ftecho::TransferError(ftecho::ErrorCode::NotFound, "Source file not found: " + source.string());
        }
        const auto source_size = std::filesystem::file_size(source, ec);
        if (ec)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::IoError,
                                        "Failed to stat " + source.string() + ": " + ec.message());
        }
        const auto file_size = static_cast<std::uint64_t>(source_size);
        const auto start = resume ? offset : 0;
        if (start > file_size)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::OffsetMismatch,
                                        "Offset " + std::to_string(start) + " exceeds local file size " +
                                            std::to_string(file_size));
        }
        const auto filename = source.filename().string();

        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Failed to open " + source.string());
        }
        ftecho::crypto::Sha256 hasher;
        if (start > 0 && ftecho::crypto::update_from_stream(hasher, in, start) != start)
        {
            throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Failed to read " + source.string());
        }

        if (resume)
        {
            const ftecho::protocol::ResumeRequest request{
                .filename = filename,
                .offset = offset,
                .direction = std::string(ftecho::protocol::to_string(ftecho::protocol::Direction::Put)),
            };
            send_text(ftecho::protocol::FrameType::Resume, nlohmann::json(request).dump());
        }
        else
        {
            const ftecho::protocol::PutRequest request{.filename = filename, .size = file_size};
            send_text(ftecho::protocol::FrameType::Put, nlohmann::json(request).dump());
        }
        expect_ok("put");
        logger_.log("put", filename, " size=", file_size, " offset=", start);

        // Never send more than the announced size, even if the file grew meanwhile.
        const auto to_send = file_size - start;
        std::vector<std::uint8_t> buffer(ftecho::protocol::kChunkSize);
        std::uint64_t sent = 0;
        while (sent < to_send)
        {
            const auto wanted = std::min<std::uint64_t>(buffer.size(), to_send - sent);
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(wanted));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                break;
            }
            const std::span<const std::uint8_t> chunk(buffer.data(), read_count);
            hasher.update(chunk);
            send_frame(ftecho::protocol::FrameType::FileData, chunk);
            sent += read_count;
        }
        if (in.bad())
        {
            close();
            throw ftecho::TransferError(ftecho::ErrorCode::IoError, "Read error on " + source.string());
        }

        const auto digest = hasher.final_hex();
        send_text(ftecho::protocol::FrameType::Checksum, digest);
        const auto reply = expect_ok("put");
        const auto server_digest = ftecho::protocol::trim(reply.text());
        logger_.log("put", filename, " sent=", sent, " sha=", digest);
        check_digests(digest, server_digest);
        return TransferResult{
            .digest = digest,
            .bytes = sent,
            .total_size = start + sent,
        };
    }

} // namespace ftecho::client
