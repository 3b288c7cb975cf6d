#include "peerdrop/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

namespace peerdrop::server
{

    namespace
    {

        std::size_t resolve_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        ReceiveOptions make_receive_options(const ServerConfig &config)
        {
            ReceiveOptions options;
            options.root = config.root;
            options.direct_file_mode = config.direct_file_mode;
            options.avoid_final_rename = config.avoid_final_rename;
            options.platform_requires_direct_mode = detect_platform_requires_direct_mode();
            options.feature_gate = receive_enabled_from_env;
            options.notify = []
            { spdlog::trace("incoming transfer state changed"); };
            return options;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          transfer_pool_(resolve_threads(config_.transfer_threads)),
          receive_manager_(make_receive_options(config_))
    {
        std::filesystem::create_directories(config_.root);

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} (direct mode: {}, avoid final rename: {})", config_.address, port_,
                     config_.direct_file_mode, config_.avoid_final_rename);

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        transfer_pool_.join();
    }

    void Server::accept_next()
    {
        // Each session runs on its own strand so its handlers never overlap.
        acceptor_.async_accept(asio::make_strand(io_context_), [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{receive_manager_, transfer_pool_, stopping_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            {
                std::lock_guard lock(sessions_mutex_);
                std::erase_if(sessions_, [](const std::weak_ptr<Session> &entry)
                              { return entry.expired(); });
                sessions_.push_back(session);
            }
            session->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    void Server::handle_signal()
    {
        stopping_.store(true);
        std::error_code ec;
        acceptor_.close(ec);
        {
            std::lock_guard lock(sessions_mutex_);
            for (const auto &entry : sessions_)
            {
                if (auto session = entry.lock())
                {
                    session->interrupt_transfer();
                }
            }
        }
        io_context_.stop();
        transfer_pool_.stop();
        spdlog::info("Shutting down");
    }

} // namespace peerdrop::server
