#include "ftecho/protocol.hpp"

#include <charconv>
#include <stdexcept>

#include "ftecho/error_codes.hpp"

namespace ftecho::protocol
{

    namespace
    {

        std::uint64_t parse_unsigned(std::string_view field, std::string_view label)
        {
            const auto text = trim(field);
            std::uint64_t value = 0;
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc{} || ptr != end)
            {
                throw TransferError(ErrorCode::MetadataParseError,
                                    "invalid " + std::string(label) + " '" + std::string(field) + "'");
            }
            return value;
        }

        std::vector<std::string_view> split(std::string_view input, char delimiter)
        {
            std::vector<std::string_view> parts;
            std::size_t start = 0;
            while (true)
            {
                const auto pos = input.find(delimiter, start);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(input.substr(start));
                    break;
                }
                parts.push_back(input.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        bool looks_like_object(std::string_view payload)
        {
            const auto text = trim(payload);
            return !text.empty() && text.front() == '{';
        }

        nlohmann::json parse_object(std::string_view payload)
        {
            try
            {
                auto json = nlohmann::json::parse(payload);
                if (!json.is_object())
                {
                    throw TransferError(ErrorCode::MetadataParseError, "expected a JSON object");
                }
                return json;
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(ErrorCode::MetadataParseError, ex.what());
            }
        }

        void require_unsigned(const nlohmann::json &json, const char *key)
        {
            if (!json.at(key).is_number_unsigned())
            {
                throw TransferError(ErrorCode::MetadataParseError,
                                    std::string("field '") + key + "' must be a non-negative integer");
            }
        }

    } // namespace

    std::string_view to_string(Direction direction) noexcept
    {
        return direction == Direction::Put ? "put" : "get";
    }

    std::optional<Direction> direction_from_string(std::string_view value) noexcept
    {
        if (value == "get")
        {
            return Direction::Get;
        }
        if (value == "put")
        {
            return Direction::Put;
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const PutRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"size", request.size},
        };
    }

    void from_json(const nlohmann::json &json, PutRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.size = json.at("size").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const ResumeRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"offset", request.offset},
            {"direction", request.direction},
        };
    }

    void from_json(const nlohmann::json &json, ResumeRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.offset = json.at("offset").get<std::uint64_t>();
        request.direction = json.value("direction", std::string{"get"});
    }

    void to_json(nlohmann::json &json, const DownloadInfo &info)
    {
        json = {{"size", info.size}};
        if (info.offset)
        {
            json["offset"] = *info.offset;
        }
    }

    void from_json(const nlohmann::json &json, DownloadInfo &info)
    {
        info.size = json.value("size", 0ULL);
        if (auto it = json.find("offset"); it != json.end())
        {
            info.offset = it->get<std::uint64_t>();
        }
        else
        {
            info.offset.reset();
        }
    }

    void to_json(nlohmann::json &json, const ResumeAck &ack)
    {
        json = {
            {"offset", ack.offset},
            {"ready", ack.ready},
        };
    }

    void from_json(const nlohmann::json &json, ResumeAck &ack)
    {
        ack.offset = json.value("offset", 0ULL);
        ack.ready = json.value("ready", false);
    }

    PutRequest parse_put_request(std::string_view payload)
    {
        if (looks_like_object(payload))
        {
            const auto json = parse_object(payload);
            try
            {
                require_unsigned(json, "size");
                return json.get<PutRequest>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(ErrorCode::MetadataParseError, ex.what());
            }
        }

        const auto separator = payload.find('|');
        if (separator == std::string_view::npos)
        {
            throw TransferError(ErrorCode::MetadataParseError, "expected 'filename|size' or a JSON object");
        }
        PutRequest request;
        request.filename = std::string(payload.substr(0, separator));
        request.size = parse_unsigned(payload.substr(separator + 1), "size");
        return request;
    }

    ResumeRequest parse_resume_request(std::string_view payload)
    {
        if (looks_like_object(payload))
        {
            const auto json = parse_object(payload);
            try
            {
                require_unsigned(json, "offset");
                return json.get<ResumeRequest>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(ErrorCode::MetadataParseError, ex.what());
            }
        }

        const auto parts = split(payload, '|');
        if (parts.size() < 2)
        {
            throw TransferError(ErrorCode::MetadataParseError, "expected 'filename|offset|direction' or a JSON object");
        }
        ResumeRequest request;
        request.filename = std::string(parts[0]);
        request.offset = parse_unsigned(parts[1], "offset");
        request.direction = parts.size() > 2 ? trim(parts[2]) : std::string{"get"};
        return request;
    }

    std::string format_listing(const std::vector<ListingEntry> &entries)
    {
        if (entries.empty())
        {
            return "\n";
        }
        std::string text;
        for (const auto &entry : entries)
        {
            text += entry.name;
            text += '|';
            text += std::to_string(entry.size);
            text += '\n';
        }
        return text;
    }

    std::vector<ListingEntry> parse_listing(std::string_view text)
    {
        std::vector<ListingEntry> entries;
        for (const auto line : split(text, '\n'))
        {
            const auto separator = line.rfind('|');
            if (line.empty() || separator == std::string_view::npos)
            {
                continue;
            }
            entries.push_back(ListingEntry{
                .name = std::string(line.substr(0, separator)),
                .size = parse_unsigned(line.substr(separator + 1), "size"),
            });
        }
        return entries;
    }

    std::string trim(std::string_view input)
    {
        const auto begin = input.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
        {
            return "";
        }
        const auto end = input.find_last_not_of(" \t\r\n");
        return std::string(input.substr(begin, end - begin + 1));
    }

} // namespace ftecho::protocol
