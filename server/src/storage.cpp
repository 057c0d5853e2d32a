#include "ftecho/server/storage.hpp"

#include <algorithm>
#include <system_error>

namespace ftecho::server
{

    StorageError::StorageError(ftecho::ErrorCode code, std::string message)
        : ftecho::TransferError(code, std::move(message)) {}

    namespace
    {

        bool ends_with_part_suffix(std::string_view name)
        {
            return name.size() >= ftecho::protocol::kPartSuffix.size() &&
                   name.substr(name.size() - ftecho::protocol::kPartSuffix.size()) == ftecho::protocol::kPartSuffix;
        }

        std::optional<std::uint64_t> regular_file_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec) || ec)
            {
                return std::nullopt;
            }
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                return std::nullopt;
            }
            return static_cast<std::uint64_t>(size);
        }

    } // namespace

    Storage::Storage(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    void Storage::validate_name(std::string_view name)
    {
        const bool invalid = name.empty() || name == "." || name == ".." ||
                             name.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos ||
                             ends_with_part_suffix(name);
        if (invalid)
        {
            throw StorageError(ftecho::ErrorCode::InvalidName, "Invalid filename: " + std::string(name));
        }
    }

    std::vector<ftecho::protocol::ListingEntry> Storage::list_committed() const
    {
        std::vector<ftecho::protocol::ListingEntry> entries;
        for (const auto &entry : std::filesystem::directory_iterator(root_))
        {
            const auto name = entry.path().filename().string();
            if (!entry.is_regular_file() || ends_with_part_suffix(name))
            {
                continue;
            }
            entries.push_back(ftecho::protocol::ListingEntry{
                .name = name,
                .size = static_cast<std::uint64_t>(entry.file_size()),
            });
        }
        std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        return entries;
    }

    std::optional<std::uint64_t> Storage::committed_size(const std::string &name) const
    {
        return regular_file_size(committed_path(name));
    }

    std::optional<std::uint64_t> Storage::staged_size(const std::string &name) const
    {
        return regular_file_size(staged_path(name));
    }

    std::ifstream Storage::open_committed(const std::string &name) const
    {
        std::ifstream file(committed_path(name), std::ios::binary);
        if (!file.is_open())
        {
            throw StorageError(ftecho::ErrorCode::NotFound, "File not found: " + name);
        }
        return file;
    }

    std::ifstream Storage::open_staged_for_read(const std::string &name) const
    {
        std::ifstream file(staged_path(name), std::ios::binary);
        if (!file.is_open())
        {
            throw StorageError(ftecho::ErrorCode::NotFound, "No partial file found for resume: " + name);
        }
        return file;
    }

    std::ofstream Storage::open_staged_for_write(const std::string &name, bool append) const
    {
        const auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
        std::ofstream file(staged_path(name), mode);
        if (!file.is_open())
        {
            throw StorageError(ftecho::ErrorCode::IoError, "Failed to open staging file for " + name);
        }
        return file;
    }

    void Storage::commit(const std::string &name) const
    {
        std::error_code ec;
        std::filesystem::rename(staged_path(name), committed_path(name), ec);
        if (ec)
        {
            throw StorageError(ftecho::ErrorCode::IoError, "Failed to commit " + name + ": " + ec.message());
        }
    }

    bool Storage::discard_staged(const std::string &name) const noexcept
    {
        std::error_code ec;
        std::filesystem::remove(staged_path(name), ec);
        return !ec;
    }

    std::filesystem::path Storage::committed_path(const std::string &name) const
    {
        return root_ / name;
    }

    std::filesystem::path Storage::staged_path(const std::string &name) const
    {
        return root_ / (name + std::string(ftecho::protocol::kPartSuffix));
    }

} // namespace ftecho::server
