#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/thread_pool.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/error_codes.hpp"
#include "peerdrop/framing.hpp"
#include "peerdrop/protocol.hpp"
#include "peerdrop/server/receive_manager.hpp"

namespace peerdrop::server
{

    struct ServerServices
    {
        ReceiveManager &receive_manager;
        // put_file blocks on disk and socket reads; it never runs on the event loop.
        asio::thread_pool &transfer_pool;
        // Set once the server shuts down; transfers that have not started yet are refused.
        const std::atomic<bool> &stopping;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

        // Unblocks a put_file waiting on this peer's body. Safe to call from any thread.
        void interrupt_transfer();

    private:
        struct PendingWrite
        {
            std::shared_ptr<std::vector<std::uint8_t>> frame;
            bool close_after{};
        };

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        // Returns false when the handler resumes reading on its own.
        bool process_message(const nlohmann::json &json);
        void write_next();
        void send_response(const peerdrop::protocol::ResponseEnvelope &envelope, bool close_after = false);
        void send_error(peerdrop::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt, bool close_after = false);

        void handle_put_file(const peerdrop::protocol::RequestEnvelope &envelope);
        void run_put_file(peerdrop::protocol::PutFileRequest request, std::optional<std::string> request_id);
        void handle_list_partial(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_hash_partial(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_list_incoming(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_list_waiting(const peerdrop::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, peerdrop::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;

        std::deque<PendingWrite> write_queue_;
        // Runs once write_queue_ drains; the socket is handed to a pool thread only when idle.
        std::function<void()> after_writes_;

        const asio::ip::tcp::socket::native_handle_type native_handle_;
        std::mutex transfer_mutex_;
        bool transfer_active_{false};
    };

} // namespace peerdrop::server
