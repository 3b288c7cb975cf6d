#include "peerdrop/server/session.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <span>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "peerdrop/crypto.hpp"

namespace peerdrop::server
{

    namespace
    {

        // Body of a PUT_FILE request: the bytes that follow the request frame.
        class SocketReader final : public peerdrop::io::Reader
        {
        public:
            SocketReader(asio::ip::tcp::socket &socket, std::int64_t length)
                : socket_(socket), remaining_(length) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (eof_ || remaining_ == 0 || buffer.empty())
                {
                    return 0;
                }
                auto wanted = buffer.size();
                if (remaining_ > 0)
                {
                    wanted = std::min<std::size_t>(wanted, static_cast<std::size_t>(remaining_));
                }
                std::error_code ec;
                const auto count = socket_.read_some(asio::buffer(buffer.data(), wanted), ec);
                if (ec == asio::error::eof)
                {
                    eof_ = true;
                    return 0;
                }
                if (ec)
                {
                    throw std::system_error(ec, "socket read");
                }
                if (remaining_ > 0)
                {
                    remaining_ -= static_cast<std::int64_t>(count);
                }
                return count;
            }

            // True when exactly the announced body was read and the next frame can follow.
            bool body_consumed() const noexcept { return remaining_ == 0 && !eof_; }

        private:
            asio::ip::tcp::socket &socket_;
            std::int64_t remaining_;
            bool eof_{false};
        };

        std::uint64_t to_unix_time(Clock::time_point time)
        {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count());
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), native_handle_(socket_.native_handle()) {}

    void Session::start()
    {
        spdlog::info("Peer connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::interrupt_transfer()
    {
        std::lock_guard lock(transfer_mutex_);
        if (transfer_active_)
        {
            // The pool thread owns the socket object; only the descriptor is touched here.
            if (::shutdown(native_handle_, SHUT_RDWR) != 0)
            {
                spdlog::warn("Failed to interrupt transfer: {}",
                             std::error_code(errno, std::system_category()).message());
            }
        }
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = peerdrop::protocol::decode_frame_size(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 send_error(peerdrop::ErrorCode::InvalidPayload, ex.what(), std::nullopt, true);
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             bool keep_reading = true;
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 keep_reading = process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(peerdrop::ErrorCode::InvalidPayload, ex.what());
                             }
                             if (keep_reading)
                             {
                                 read_frame_header();
                             }
                         });
    }

    bool Session::process_message(const nlohmann::json &json)
    {
        peerdrop::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<peerdrop::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(peerdrop::ErrorCode::InvalidCommand, ex.what());
            return true;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), peerdrop::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case peerdrop::protocol::Command::PutFile:
            handle_put_file(envelope);
            return false;
        case peerdrop::protocol::Command::ListPartial:
            handle_list_partial(envelope);
            break;
        case peerdrop::protocol::Command::HashPartial:
            handle_hash_partial(envelope);
            break;
        case peerdrop::protocol::Command::ListIncoming:
            handle_list_incoming(envelope);
            break;
        case peerdrop::protocol::Command::ListWaiting:
            handle_list_waiting(envelope);
            break;
        case peerdrop::protocol::Command::Ping:
            send_response(peerdrop::protocol::make_ok_response(nlohmann::json::object(), envelope.request_id));
            break;
        default:
            send_error(peerdrop::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
        return true;
    }

    void Session::send_response(const peerdrop::protocol::ResponseEnvelope &envelope, bool close_after)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(peerdrop::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        write_queue_.push_back(PendingWrite{.frame = std::move(frame), .close_after = close_after});
        if (write_queue_.size() == 1)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        const auto &frame = write_queue_.front().frame;
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              const bool close_after = write_queue_.front().close_after;
                              write_queue_.pop_front();
                              if (ec || close_after)
                              {
                                  write_queue_.clear();
                                  after_writes_ = nullptr;
                                  stop();
                                  return;
                              }
                              if (!write_queue_.empty())
                              {
                                  write_next();
                                  return;
                              }
                              if (after_writes_)
                              {
                                  auto next = std::move(after_writes_);
                                  after_writes_ = nullptr;
                                  next();
                              }
                          });
    }

    void Session::send_error(peerdrop::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             bool close_after)
    {
        send_response(peerdrop::protocol::make_error_response(code, std::move(message), request_id), close_after);
    }

    void Session::handle_put_file(const peerdrop::protocol::RequestEnvelope &envelope)
    {
        peerdrop::protocol::PutFileRequest request;
        try
        {
            request = envelope.payload.get<peerdrop::protocol::PutFileRequest>();
        }
        catch (const std::exception &ex)
        {
            // The body that follows cannot be skipped reliably.
            send_error(peerdrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id, true);
            return;
        }

        auto self = shared_from_this();
        auto start = [this, self, request = std::move(request), request_id = envelope.request_id]() mutable
        { run_put_file(std::move(request), std::move(request_id)); };
        if (write_queue_.empty())
        {
            start();
        }
        else
        {
            after_writes_ = std::move(start);
        }
    }

    void Session::run_put_file(peerdrop::protocol::PutFileRequest request, std::optional<std::string> request_id)
    {
        auto self = shared_from_this();
        asio::post(services_.transfer_pool, [this, self, request = std::move(request), request_id = std::move(request_id)]
                   {
            SocketReader reader(socket_, request.length);
            peerdrop::protocol::ResponseEnvelope response;
            bool admitted = false;
            {
                std::lock_guard lock(transfer_mutex_);
                admitted = !services_.stopping.load();
                transfer_active_ = admitted;
            }
            if (!admitted)
            {
                response = peerdrop::protocol::make_error_response(peerdrop::ErrorCode::Unavailable,
                                                                   "server is shutting down", request_id);
            }
            else
            {
                try
                {
                    const auto length = services_.receive_manager.put_file(request.sender, request.name, reader,
                                                                           request.offset, request.length);
                    response = peerdrop::protocol::make_ok_response(
                        nlohmann::json(peerdrop::protocol::PutFileResponse{.length = length}), request_id);
                    spdlog::info("Received {} bytes from {}", length, remote_endpoint());
                }
                catch (const StorageError &error)
                {
                    response = peerdrop::protocol::make_error_response(error.code(), error.what(), request_id);
                }
                catch (const std::exception &error)
                {
                    response = peerdrop::protocol::make_error_response(peerdrop::ErrorCode::InternalError,
                                                                       error.what(), request_id);
                }
                std::lock_guard lock(transfer_mutex_);
                transfer_active_ = false;
            }

            const bool keep_open = reader.body_consumed();
            asio::post(socket_.get_executor(), [this, self, response = std::move(response), keep_open]
                       {
                send_response(response, !keep_open);
                if (keep_open)
                {
                    read_frame_header();
                } }); });
    }

    void Session::handle_list_partial(const peerdrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<peerdrop::protocol::PartialFileRequest>();
            peerdrop::protocol::PartialListResponse response{
                .names = services_.receive_manager.partial_files(request.sender),
            };
            send_response(peerdrop::protocol::make_ok_response(nlohmann::json(response), envelope.request_id));
        }
        catch (const StorageError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(peerdrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_hash_partial(const peerdrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<peerdrop::protocol::PartialFileRequest>();
            const auto result = services_.receive_manager.hash_partial_file(request.sender, request.name);
            peerdrop::protocol::PartialHashResponse response{
                .size = result.size,
                .digest = crypto::to_hex(result.digest),
            };
            send_response(peerdrop::protocol::make_ok_response(nlohmann::json(response), envelope.request_id));
        }
        catch (const StorageError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(peerdrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_list_incoming(const peerdrop::protocol::RequestEnvelope &envelope)
    {
        std::vector<peerdrop::protocol::IncomingTransferInfo> transfers;
        for (const auto &snapshot : services_.receive_manager.incoming_files())
        {
            transfers.push_back(peerdrop::protocol::IncomingTransferInfo{
                .sender = snapshot.key.sender,
                .name = snapshot.key.name,
                .started = to_unix_time(snapshot.started),
                .declared_length = snapshot.declared_length,
                .copied = snapshot.copied,
                .done = snapshot.done,
            });
        }
        nlohmann::json payload;
        payload["transfers"] = transfers;
        send_response(peerdrop::protocol::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_list_waiting(const peerdrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            std::vector<peerdrop::protocol::WaitingFileInfo> files;
            for (auto &file : services_.receive_manager.waiting_files())
            {
                files.push_back(peerdrop::protocol::WaitingFileInfo{.name = std::move(file.name), .size = file.size});
            }
            nlohmann::json payload;
            payload["files"] = files;
            send_response(peerdrop::protocol::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const StorageError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id);
        }
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace peerdrop::server
