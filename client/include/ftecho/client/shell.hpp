#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "ftecho/client/client.hpp"

namespace ftecho::client
{

    /// Line-oriented front end over Client. Reads commands from `in` until quit or end of
    /// input; a failing command prints "Error: <text>" and the loop goes on.
    class Shell
    {
    public:
        Shell(Client &client, std::istream &in, std::ostream &out);

        int run();

        /// Runs one command line. Returns false when the shell should stop.
        bool execute(const std::string &line);

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void print_help();

        void handle_connect(const std::vector<std::string> &args);
        void handle_list();
        void handle_get(const std::vector<std::string> &args);
        void handle_put(const std::vector<std::string> &args);
        void handle_resume(const std::vector<std::string> &args);
        void print_result(const TransferResult &result);

        bool require_connection();

        Client &client_;
        std::istream &in_;
        std::ostream &out_;
    };

} // namespace ftecho::client
