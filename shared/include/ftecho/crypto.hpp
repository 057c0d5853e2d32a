/**
 * FT-Echo - SHA-256 digest helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace ftecho::crypto
{

    constexpr std::size_t kDigestHexLength = crypto_hash_sha256_BYTES * 2;

    void ensure_sodium_init();

    // Incremental SHA-256 accumulator. final_hex() may be called once.
    class Sha256
    {
    public:
        Sha256();

        void update(std::span<const std::uint8_t> data);
        void update(std::string_view data);

        std::string final_hex();

    private:
        crypto_hash_sha256_state state_{};
        bool finalized_{false};
    };

    std::string hash_bytes(std::span<const std::uint8_t> data);

    /// Hashes up to `limit` bytes (everything when unset) from the current stream position.
    /// Returns the number of bytes consumed.
    std::uint64_t update_from_stream(Sha256 &hasher, std::istream &input,
                                     std::optional<std::uint64_t> limit = std::nullopt);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// Digest of the first `length` bytes of `path`; the file must hold at least that many.
    std::string hash_file_prefix(const std::filesystem::path &path, std::uint64_t length);

    bool is_hex_digest(std::string_view text) noexcept;

} // namespace ftecho::crypto
