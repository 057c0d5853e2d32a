#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ftecho::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{9000};
        std::filesystem::path root{"storage"};
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

} // namespace ftecho::server
