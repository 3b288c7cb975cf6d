#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "peerdrop/server/config.hpp"
#include "peerdrop/server/receive_manager.hpp"
#include "peerdrop/server/session.hpp"

namespace peerdrop::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Asks run() to return; transfers blocked on a silent peer are interrupted.
        void stop();

        // Bound port, useful when the config asked for port 0.
        std::uint16_t port() const noexcept { return port_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::thread_pool transfer_pool_;
        std::uint16_t port_{0};
        std::atomic<bool> stopping_{false};

        ReceiveManager receive_manager_;

        std::mutex sessions_mutex_;
        std::vector<std::weak_ptr<Session>> sessions_;

        std::vector<std::thread> workers_;
    };

} // namespace peerdrop::server
