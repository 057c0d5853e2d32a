#include "ftecho/client/shell.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ftecho/error_codes.hpp"
#include "ftecho/protocol.hpp"

namespace ftecho::client
{

    namespace
    {

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::uint64_t parse_number(const std::string &text, const char *what)
        {
            std::uint64_t value = 0;
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc{} || ptr != end)
            {
                throw std::runtime_error(std::string("Invalid ") + what + ": " + text);
            }
            return value;
        }

    } // namespace

    Shell::Shell(Client &client, std::istream &in, std::ostream &out)
        : client_(client), in_(in), out_(out) {}

    int Shell::run()
    {
        out_ << "FT-Echo CLI Client" << std::endl;
        out_ << "Type 'help' for commands" << std::endl;
        while (true)
        {
            out_ << "ft-echo> " << std::flush;
            std::string line;
            if (!std::getline(in_, line))
            {
                out_ << std::endl;
                break;
            }
            if (!execute(line))
            {
                break;
            }
        }
        client_.quit();
        out_ << "Goodbye!" << std::endl;
        return 0;
    }

    bool Shell::execute(const std::string &line)
    {
        const auto tokens = split_tokens(line);
        if (tokens.empty())
        {
            return true;
        }
        const auto command = to_lower(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "quit" || command == "exit")
        {
            return false;
        }
        if (command == "help")
        {
            print_help();
            return true;
        }

        try
        {
            if (!dispatch(command, args))
            {
                out_ << "Unknown command: " << command << ". Type 'help' for commands" << std::endl;
            }
        }
        catch (const std::exception &ex)
        {
            out_ << "Error: " << ex.what() << std::endl;
        }
        return true;
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "connect")
        {
            handle_connect(args);
            return true;
        }
        if (command == "list")
        {
            handle_list();
            return true;
        }
        if (command == "get")
        {
            handle_get(args);
            return true;
        }
        if (command == "put")
        {
            handle_put(args);
            return true;
        }
        if (command == "resume")
        {
            handle_resume(args);
            return true;
        }
        return false;
    }

    void Shell::print_help()
    {
        out_ << "Available commands:" << std::endl;
        out_ << "  connect <host> <port>                   Connect to server" << std::endl;
        out_ << "  list                                    List files on server" << std::endl;
        out_ << "  get <filename> [dest]                   Download a file" << std::endl;
        out_ << "  put <filepath>                          Upload a file" << std::endl;
        out_ << "  resume <file> <offset> <get|put> [dest] Resume an interrupted transfer" << std::endl;
        out_ << "  quit | exit                             Disconnect and exit" << std::endl;
        out_ << "  help                                    Show this help" << std::endl;
    }

    bool Shell::require_connection()
    {
        if (client_.is_connected())
        {
            return true;
        }
        out_ << "Not connected. Use 'connect <host> <port>' first" << std::endl;
        return false;
    }

    void Shell::handle_connect(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            out_ << "Usage: connect <host> <port>" << std::endl;
            return;
        }
        const auto port = parse_number(args[1], "port");
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Invalid port: " + args[1]);
        }
        client_.quit();
        client_.connect(args[0], static_cast<std::uint16_t>(port));
        out_ << "Connected to " << args[0] << ':' << port << std::endl;
    }

    void Shell::handle_list()
    {
        if (!require_connection())
        {
            return;
        }
        const auto entries = client_.list();
        if (entries.empty())
        {
            out_ << "No files found on server" << std::endl;
            return;
        }
        out_ << "Found " << entries.size() << " files:" << std::endl;
        out_ << std::left << std::setw(40) << "Filename" << ' ' << std::right << std::setw(15) << "Size" << std::endl;
        out_ << std::string(60, '-') << std::endl;
        for (const auto &entry : entries)
        {
            out_ << std::left << std::setw(40) << entry.name << ' ' << std::right << std::setw(15) << entry.size
                 << " bytes" << std::endl;
        }
    }

    void Shell::handle_get(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            out_ << "Usage: get <filename> [dest]" << std::endl;
            return;
        }
        if (!require_connection())
        {
            return;
        }
        const std::filesystem::path destination = args.size() == 2 ? args[1] : args[0];
        out_ << "Downloading " << args[0] << " to " << destination.string() << "..." << std::endl;
        print_result(client_.get(args[0], destination));
    }

    void Shell::handle_put(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            out_ << "Usage: put <filepath>" << std::endl;
            return;
        }
        if (!require_connection())
        {
            return;
        }
        out_ << "Uploading " << args[0] << "..." << std::endl;
        print_result(client_.put(args[0]));
    }

    void Shell::handle_resume(const std::vector<std::string> &args)
    {
        if (args.size() < 3 || args.size() > 4)
        {
            out_ << "Usage: resume <file> <offset> <get|put> [dest]" << std::endl;
            return;
        }
        const auto offset = parse_number(args[1], "offset");
        const auto direction = ftecho::protocol::direction_from_string(to_lower(args[2]));
        if (!direction)
        {
            out_ << "Invalid direction: " << args[2] << ". Use 'get' or 'put'" << std::endl;
            return;
        }
        if (!require_connection())
        {
            return;
        }
        if (*direction == ftecho::protocol::Direction::Get)
        {
            const std::filesystem::path destination = args.size() == 4 ? args[3] : args[0];
            out_ << "Resuming GET " << args[0] << " from offset " << offset << "..." << std::endl;
            print_result(client_.get(args[0], destination, true, offset));
        }
        else
        {
            out_ << "Resuming PUT " << args[0] << " from offset " << offset << "..." << std::endl;
            print_result(client_.put(args[0], true, offset));
        }
    }

    void Shell::print_result(const TransferResult &result)
    {
        out_ << "Transfer complete" << std::endl;
        out_ << "  SHA256: " << result.digest << std::endl;
        out_ << "  Size: " << result.total_size << " bytes" << std::endl;
    }

} // namespace ftecho::client
