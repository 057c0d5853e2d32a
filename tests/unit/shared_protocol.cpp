#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ftecho/crypto.hpp"
#include "ftecho/error_codes.hpp"
#include "ftecho/framing.hpp"
#include "ftecho/protocol.hpp"

using namespace ftecho;
using namespace ftecho::protocol;

void run_server_component_tests();

namespace
{

    constexpr const char *kHelloDigest = "d1a65b290ab4013e3180743e3ef7b7ff624320dc3e4a0885dc994d34cfe73c9f";
    constexpr const char *kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    constexpr const char *kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    template <typename Fn>
    std::optional<ErrorCode> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_framing()
    {
        const auto encoded = encode_frame(FrameType::Get, std::string_view("hello.txt"));
        assert(encoded.size() == kHeaderSize + 1 + 9);
        assert(encoded[0] == 0 && encoded[1] == 0 && encoded[2] == 0 && encoded[3] == 10);
        assert(encoded[4] == 'G');

        const auto decoded = try_decode_frame(encoded);
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == encoded.size());
        assert(decoded->frame.type == FrameType::Get);
        assert(decoded->frame.text() == "hello.txt");

        // An empty payload still carries the type byte.
        const auto list = encode_frame(FrameType::List, std::string_view{});
        assert(list.size() == kHeaderSize + 1);
        assert(list[3] == 1 && list[4] == 'L');
        const auto decoded_list = try_decode_frame(list);
        assert(decoded_list && decoded_list->frame.payload.empty());

        // Two frames back to back decode one at a time.
        auto stream = encode_frame(FrameType::Ok, std::string_view("Goodbye"));
        const auto tail = encode_frame(FrameType::Quit, std::string_view{});
        stream.insert(stream.end(), tail.begin(), tail.end());
        const auto first = try_decode_frame(stream);
        assert(first && first->frame.type == FrameType::Ok && first->frame.text() == "Goodbye");
        const auto second = try_decode_frame(std::span<const std::uint8_t>(stream).subspan(first->bytes_consumed));
        assert(second && second->frame.type == FrameType::Quit);
    }

    void test_framing_incomplete_and_invalid()
    {
        const auto encoded = encode_frame(FrameType::FileData, std::string_view("abcdef"));
        for (std::size_t cut = 0; cut < encoded.size(); ++cut)
        {
            assert(!try_decode_frame(std::span<const std::uint8_t>(encoded.data(), cut)).has_value());
        }

        const std::array<std::uint8_t, kHeaderSize> zero{0, 0, 0, 0};
        assert(error_of([&]
                        { (void)decode_length(zero); }) == ErrorCode::FramingError);
        assert(error_of([&]
                        { (void)try_decode_frame(zero); }) == ErrorCode::FramingError);

        const std::array<std::uint8_t, kHeaderSize> huge{0xff, 0xff, 0xff, 0xff};
        assert(error_of([&]
                        { (void)decode_length(huge); }) == ErrorCode::FramingError);

        const std::array<std::uint8_t, kHeaderSize> one{0, 0, 0, 1};
        assert(decode_length(one) == 1);

        // Unknown types survive decoding; rejecting them is the session's business.
        const std::vector<std::uint8_t> unknown{'X', 'y'};
        const auto frame = decode_body(unknown);
        assert(to_char(frame.type) == 'X');
        assert(!is_known(frame.type));
        assert(is_known(FrameType::Checksum));
    }

    void test_put_metadata()
    {
        const auto pipe = parse_put_request("hello.txt|16");
        assert(pipe.filename == "hello.txt");
        assert(pipe.size == 16);

        const auto json = parse_put_request(R"({"filename": "data.bin", "size": 10000})");
        assert(json.filename == "data.bin");
        assert(json.size == 10000);

        const PutRequest request{.filename = "a|b.txt", .size = 3};
        const auto reparsed = parse_put_request(nlohmann::json(request).dump());
        assert(reparsed.filename == "a|b.txt" && reparsed.size == 3);

        assert(error_of([]
                        { (void)parse_put_request("hello.txt"); }) == ErrorCode::MetadataParseError);
        assert(error_of([]
                        { (void)parse_put_request("hello.txt|abc"); }) == ErrorCode::MetadataParseError);
        assert(error_of([]
                        { (void)parse_put_request("{not json"); }) == ErrorCode::MetadataParseError);
        assert(error_of([]
                        { (void)parse_put_request(R"({"filename": "x"})"); }) == ErrorCode::MetadataParseError);
        assert(error_of([]
                        { (void)parse_put_request(R"({"filename": "x", "size": -1})"); }) ==
               ErrorCode::MetadataParseError);
    }

    void test_resume_metadata()
    {
        const auto pipe = parse_resume_request("big.bin|4096|put");
        assert(pipe.filename == "big.bin");
        assert(pipe.offset == 4096);
        assert(pipe.direction == "put");

        const auto defaulted = parse_resume_request("big.bin|10");
        assert(defaulted.direction == "get");

        const auto json = parse_resume_request(R"({"filename": "big.bin", "offset": 7})");
        assert(json.offset == 7);
        assert(json.direction == "get");

        // An unknown direction parses; the caller reports it.
        const auto sideways = parse_resume_request("big.bin|1|sideways");
        assert(sideways.direction == "sideways");
        assert(!direction_from_string(sideways.direction));
        assert(direction_from_string("get") == Direction::Get);
        assert(direction_from_string("put") == Direction::Put);

        assert(error_of([]
                        { (void)parse_resume_request("big.bin"); }) == ErrorCode::MetadataParseError);
        assert(error_of([]
                        { (void)parse_resume_request("big.bin|ten|get"); }) == ErrorCode::MetadataParseError);
    }

    void test_acknowledgements()
    {
        const nlohmann::json get_ack = DownloadInfo{.size = 16};
        assert(get_ack.dump() == R"({"size":16})");
        const nlohmann::json resume_ack = DownloadInfo{.size = 100, .offset = 40};
        const auto info = resume_ack.get<DownloadInfo>();
        assert(info.size == 100 && info.offset == 40u);

        const nlohmann::json put_ack = ResumeAck{.offset = 12};
        assert(put_ack.at("offset") == 12);
        assert(put_ack.at("ready") == true);
    }

    void test_listing()
    {
        assert(format_listing({}) == "\n");
        assert(parse_listing("\n").empty());

        const std::vector<ListingEntry> entries{{"a.txt", 1}, {"hello.txt", 16}};
        const auto text = format_listing(entries);
        assert(text == "a.txt|1\nhello.txt|16\n");
        assert(parse_listing(text) == entries);

        const auto piped = parse_listing("odd|name.txt|5\n");
        assert(piped.size() == 1);
        assert(piped[0].name == "odd|name.txt");
        assert(piped[0].size == 5);

        assert(trim("  abc \r\n") == "abc");
        assert(trim(" \t").empty());
    }

    void test_crypto()
    {
        assert(crypto::hash_bytes({}) == kEmptyDigest);

        const std::string hello = "Hello, FT-Echo!\n";
        const auto *hello_bytes = reinterpret_cast<const std::uint8_t *>(hello.data());
        assert(crypto::hash_bytes(std::span<const std::uint8_t>(hello_bytes, hello.size())) == kHelloDigest);

        crypto::Sha256 incremental;
        incremental.update(std::string_view("a"));
        incremental.update(std::string_view("bc"));
        const auto digest = incremental.final_hex();
        assert(digest == kAbcDigest);
        assert(digest.size() == crypto::kDigestHexLength);
        assert(crypto::is_hex_digest(digest));
        assert(!crypto::is_hex_digest("ABC"));

        bool threw = false;
        try
        {
            (void)incremental.final_hex();
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);

        std::istringstream stream("abcdef");
        crypto::Sha256 limited;
        assert(crypto::update_from_stream(limited, stream, 3) == 3);
        assert(limited.final_hex() == kAbcDigest);
        assert(crypto::hash_stream(stream) == crypto::hash_bytes(std::span<const std::uint8_t>(
                                                    reinterpret_cast<const std::uint8_t *>("def"), 3)));
    }

    void test_file_digests()
    {
        const auto path = std::filesystem::temp_directory_path() / "ftecho_digest_test.txt";
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << "Hello, FT-Echo!\n";
        }
        assert(crypto::hash_file(path) == kHelloDigest);
        assert(crypto::hash_file_prefix(path, 0) == kEmptyDigest);

        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << "abcdef";
        }
        assert(crypto::hash_file_prefix(path, 3) == kAbcDigest);
        assert(error_of([&]
                        { (void)crypto::hash_file_prefix(path, 100); }) == ErrorCode::SizeMismatch);

        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::ChecksumMismatch) == "checksum_mismatch");
        assert(to_string(ErrorCode::FramingError) == "framing_error");
        const TransferError error(ErrorCode::NotFound, "File not found: x");
        assert(error.code() == ErrorCode::NotFound);
        assert(std::string(error.what()) == "File not found: x");
    }

} // namespace

int main()
{
    try
    {
        test_framing();
        test_framing_incomplete_and_invalid();
        test_put_metadata();
        test_resume_metadata();
        test_acknowledgements();
        test_listing();
        test_crypto();
        test_file_digests();
        test_error_codes();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All unit tests passed\n";
    return 0;
}
