#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <thread>
#include <vector>

#include "ftecho/server/config.hpp"
#include "ftecho/server/storage.hpp"

namespace ftecho::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        /// Blocks until stop() is called or SIGINT/SIGTERM arrives.
        void run();

        void stop();

        // Bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Storage storage_;

        std::vector<std::thread> workers_;
    };

} // namespace ftecho::server
