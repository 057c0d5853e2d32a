#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftecho/error_codes.hpp"
#include "ftecho/protocol.hpp"

namespace ftecho::server
{

    class StorageError : public ftecho::TransferError
    {
    public:
        StorageError(ftecho::ErrorCode code, std::string message);
    };

    /// Flat file store. A committed file lives at `<root>/<name>`; an upload in progress is
    /// staged at `<root>/<name>.part` and becomes visible only through commit().
    class Storage
    {
    public:
        explicit Storage(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        /// Throws StorageError(InvalidName) unless `name` is a plain flat-namespace file name.
        static void validate_name(std::string_view name);

        std::vector<ftecho::protocol::ListingEntry> list_committed() const;

        /// Size of the committed regular file, or nullopt when there is none.
        std::optional<std::uint64_t> committed_size(const std::string &name) const;

        /// Size of the staged upload, or nullopt when there is none.
        std::optional<std::uint64_t> staged_size(const std::string &name) const;

        std::ifstream open_committed(const std::string &name) const;

        std::ifstream open_staged_for_read(const std::string &name) const;

        /// Truncates the staged file unless `append` is set.
        std::ofstream open_staged_for_write(const std::string &name, bool append) const;

        /// Atomically renames `<name>.part` over `<name>`.
        void commit(const std::string &name) const;

        /// Removes `<name>.part` if present. Returns false when removal failed.
        bool discard_staged(const std::string &name) const noexcept;

        std::filesystem::path committed_path(const std::string &name) const;
        std::filesystem::path staged_path(const std::string &name) const;

    private:
        std::filesystem::path root_;
    };

} // namespace ftecho::server
