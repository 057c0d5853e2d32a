#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ftecho/crypto.hpp"
#include "ftecho/error_codes.hpp"
#include "ftecho/server/storage.hpp"

using namespace ftecho;
using namespace ftecho::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        return root;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::optional<ErrorCode> name_error(const std::string &name)
    {
        try
        {
            Storage::validate_name(name);
        }
        catch (const StorageError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_storage_creates_root()
    {
        const auto root = fresh_root("ftecho_storage_root") / "nested";
        Storage storage(root);
        assert(std::filesystem::is_directory(root));
        assert(storage.list_committed().empty());
        cleanup_path(root.parent_path());
    }

    void test_storage_listing_hides_staged()
    {
        const auto root = fresh_root("ftecho_storage_listing");
        Storage storage(root);
        write_file(root / "b.txt", "bb");
        write_file(root / "a.txt", "a");
        write_file(root / "c.bin.part", "partial");
        std::filesystem::create_directories(root / "subdir");

        const auto entries = storage.list_committed();
        assert(entries.size() == 2);
        assert(entries[0].name == "a.txt" && entries[0].size == 1);
        assert(entries[1].name == "b.txt" && entries[1].size == 2);

        assert(storage.committed_size("a.txt") == 1u);
        assert(!storage.committed_size("c.bin"));
        assert(storage.staged_size("c.bin") == 7u);
        assert(!storage.staged_size("a.txt"));
        cleanup_path(root);
    }

    void test_storage_commit_replaces()
    {
        const auto root = fresh_root("ftecho_storage_commit");
        Storage storage(root);
        write_file(root / "doc.txt", "old contents");

        {
            auto staged = storage.open_staged_for_write("doc.txt", false);
            staged << "new";
        }
        // Readers still see the old version until commit.
        assert(read_file(root / "doc.txt") == "old contents");
        {
            auto staged = storage.open_staged_for_write("doc.txt", true);
            staged << " data";
        }
        assert(storage.staged_size("doc.txt") == 8u);

        storage.commit("doc.txt");
        assert(read_file(root / "doc.txt") == "new data");
        assert(!storage.staged_size("doc.txt"));
        assert(crypto::hash_file(storage.committed_path("doc.txt")) ==
               crypto::hash_bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>("new data"), 8)));
        cleanup_path(root);
    }

    void test_storage_missing_files()
    {
        const auto root = fresh_root("ftecho_storage_missing");
        Storage storage(root);

        bool not_found = false;
        try
        {
            (void)storage.open_committed("missing.bin");
        }
        catch (const StorageError &ex)
        {
            not_found = ex.code() == ErrorCode::NotFound && std::string(ex.what()) == "File not found: missing.bin";
        }
        assert(not_found);

        bool no_partial = false;
        try
        {
            (void)storage.open_staged_for_read("missing.bin");
        }
        catch (const StorageError &ex)
        {
            no_partial = ex.code() == ErrorCode::NotFound &&
                         std::string(ex.what()) == "No partial file found for resume: missing.bin";
        }
        assert(no_partial);

        bool commit_failed = false;
        try
        {
            storage.commit("missing.bin");
        }
        catch (const StorageError &ex)
        {
            commit_failed = ex.code() == ErrorCode::IoError;
        }
        assert(commit_failed);
        cleanup_path(root);
    }

    void test_storage_discard()
    {
        const auto root = fresh_root("ftecho_storage_discard");
        Storage storage(root);
        write_file(storage.staged_path("upload.bin"), "xyz");
        assert(storage.discard_staged("upload.bin"));
        assert(!std::filesystem::exists(root / "upload.bin.part"));
        // Nothing to remove is not a failure.
        assert(storage.discard_staged("upload.bin"));
        cleanup_path(root);
    }

    void test_name_validation()
    {
        assert(!name_error("hello.txt"));
        assert(!name_error("archive.tar.gz"));
        assert(!name_error(".hidden"));
        assert(name_error("") == ErrorCode::InvalidName);
        assert(name_error(".") == ErrorCode::InvalidName);
        assert(name_error("..") == ErrorCode::InvalidName);
        assert(name_error("../etc/passwd") == ErrorCode::InvalidName);
        assert(name_error("dir/file") == ErrorCode::InvalidName);
        assert(name_error("dir\\file") == ErrorCode::InvalidName);
        assert(name_error("upload.part") == ErrorCode::InvalidName);
        assert(name_error(std::string("a\0b", 3)) == ErrorCode::InvalidName);
    }

} // namespace

void run_server_component_tests()
{
    test_storage_creates_root();
    test_storage_listing_hides_staged();
    test_storage_commit_replaces();
    test_storage_missing_files();
    test_storage_discard();
    test_name_validation();
}
