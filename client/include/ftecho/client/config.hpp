#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ftecho::client
{

    struct ClientConfig
    {
        std::optional<std::string> host;
        std::uint16_t port{9000};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace ftecho::client
