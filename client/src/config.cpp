#include "ftecho/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ftecho::client
{

    namespace
    {

        std::uint16_t parse_port(const std::string &text)
        {
            std::size_t consumed = 0;
            const auto value = std::stoul(text, &consumed);
            if (consumed != text.size() || value == 0 || value > 65535)
            {
                throw std::runtime_error("Invalid port: " + text);
            }
            return static_cast<std::uint16_t>(value);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!config.host)
            {
                const auto colon_pos = arg.rfind(':');
                if (colon_pos == std::string::npos)
                {
                    throw std::runtime_error("Expected endpoint format host:port");
                }
                config.host = arg.substr(0, colon_pos);
                config.port = parse_port(arg.substr(colon_pos + 1));
            }
            else
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }
        return config;
    }

} // namespace ftecho::client
