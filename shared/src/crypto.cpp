#include "ftecho/crypto.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "ftecho/error_codes.hpp"

namespace ftecho::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        std::ifstream open_for_hashing(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw TransferError(ErrorCode::IoError, "Failed to open file for hashing: " + path.string());
            }
            return file;
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Sha256::Sha256()
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(&state_) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    void Sha256::update(std::span<const std::uint8_t> data)
    {
        if (finalized_)
        {
            throw std::logic_error("Sha256 updated after finalization");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_hash_sha256_update(&state_, data.data(), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    void Sha256::update(std::string_view data)
    {
        update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(data.data()), data.size()));
    }

    std::string Sha256::final_hex()
    {
        if (finalized_)
        {
            throw std::logic_error("Sha256 finalized twice");
        }
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(&state_, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finalized_ = true;
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::uint8_t> data)
    {
        Sha256 hasher;
        hasher.update(data);
        return hasher.final_hex();
    }

    std::uint64_t update_from_stream(Sha256 &hasher, std::istream &input, std::optional<std::uint64_t> limit)
    {
        std::vector<std::uint8_t> buffer(64 * 1024);
        std::uint64_t consumed = 0;
        while (input && (!limit || consumed < *limit))
        {
            auto wanted = static_cast<std::uint64_t>(buffer.size());
            if (limit)
            {
                wanted = std::min(wanted, *limit - consumed);
            }
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(wanted));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count == 0)
            {
                break;
            }
            hasher.update(std::span<const std::uint8_t>(buffer.data(), read_count));
            consumed += read_count;
        }
        if (input.bad())
        {
            throw TransferError(ErrorCode::IoError, "Read error while hashing");
        }
        return consumed;
    }

    std::string hash_stream(std::istream &input)
    {
        Sha256 hasher;
        update_from_stream(hasher, input);
        return hasher.final_hex();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        auto file = open_for_hashing(path);
        return hash_stream(file);
    }

    std::string hash_file_prefix(const std::filesystem::path &path, std::uint64_t length)
    {
        auto file = open_for_hashing(path);
        Sha256 hasher;
        const auto consumed = update_from_stream(hasher, file, length);
        if (consumed != length)
        {
            throw TransferError(ErrorCode::SizeMismatch,
                                "File " + path.filename().string() + " holds " + std::to_string(consumed) +
                                    " bytes, expected at least " + std::to_string(length));
        }
        return hasher.final_hex();
    }

    bool is_hex_digest(std::string_view text) noexcept
    {
        return text.size() == kDigestHexLength &&
               std::all_of(text.begin(), text.end(), [](char ch)
                           { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); });
    }

} // namespace ftecho::crypto
