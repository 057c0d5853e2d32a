/**
 * FT-Echo - Command and response payload schema shared by client and server.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ftecho::protocol
{

    constexpr std::size_t kChunkSize = 4096;
    constexpr std::string_view kPartSuffix = ".part";
    constexpr std::string_view kReadyMessage = "Ready to receive";
    constexpr std::string_view kGoodbyeMessage = "Goodbye";

    enum class Direction : std::uint8_t
    {
        Get,
        Put
    };

    std::string_view to_string(Direction direction) noexcept;
    std::optional<Direction> direction_from_string(std::string_view value) noexcept;

    // P payload.
    struct PutRequest
    {
        std::string filename;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const PutRequest &request);
    void from_json(const nlohmann::json &json, PutRequest &request);

    // R payload. The direction is kept as text so the server can echo an invalid one back.
    struct ResumeRequest
    {
        std::string filename;
        std::uint64_t offset{};
        std::string direction{"get"};
    };

    void to_json(nlohmann::json &json, const ResumeRequest &request);
    void from_json(const nlohmann::json &json, ResumeRequest &request);

    // O payload acknowledging GET (offset absent) and GET-RESUME.
    struct DownloadInfo
    {
        std::uint64_t size{};
        std::optional<std::uint64_t> offset{};
    };

    void to_json(nlohmann::json &json, const DownloadInfo &info);
    void from_json(const nlohmann::json &json, DownloadInfo &info);

    // O payload acknowledging PUT-RESUME.
    struct ResumeAck
    {
        std::uint64_t offset{};
        bool ready{true};
    };

    void to_json(nlohmann::json &json, const ResumeAck &ack);
    void from_json(const nlohmann::json &json, ResumeAck &ack);

    struct ListingEntry
    {
        std::string name;
        std::uint64_t size{};

        bool operator==(const ListingEntry &) const = default;
    };

    /// Accepts the JSON object form and the legacy "filename|size" form.
    /// Throws TransferError(MetadataParseError).
    PutRequest parse_put_request(std::string_view payload);

    /// Accepts the JSON object form and the legacy "filename|offset|direction" form.
    /// Throws TransferError(MetadataParseError).
    ResumeRequest parse_resume_request(std::string_view payload);

    /// One "name|size" line per entry, each newline-terminated; an empty listing is a lone newline.
    std::string format_listing(const std::vector<ListingEntry> &entries);

    std::vector<ListingEntry> parse_listing(std::string_view text);

    std::string trim(std::string_view input);

} // namespace ftecho::protocol
