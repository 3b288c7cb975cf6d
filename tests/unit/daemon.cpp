#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "peerdrop/framing.hpp"
#include "peerdrop/protocol.hpp"
#include "peerdrop/server/server.hpp"
#include "test_support.hpp"

using namespace peerdrop;
using namespace peerdrop::server;
using asio::ip::tcp;

namespace
{

    ServerConfig loopback_config(const std::filesystem::path &root)
    {
        ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.worker_threads = 1;
        config.transfer_threads = 2;
        return config;
    }

    class RunningServer
    {
    public:
        explicit RunningServer(const std::filesystem::path &root)
            : server_(loopback_config(root)), thread_([this]
                                                      { server_.run(); }) {}

        ~RunningServer() { stop(); }

        void stop()
        {
            if (thread_.joinable())
            {
                server_.stop();
                thread_.join();
            }
        }

        std::uint16_t port() const { return server_.port(); }

    private:
        Server server_;
        std::thread thread_;
    };

    class TestClient
    {
    public:
        explicit TestClient(std::uint16_t port) : socket_(io_context_)
        {
            socket_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        }

        void send_request(protocol::Command command, nlohmann::json payload, std::string_view body = {})
        {
            auto frame = encode(command, std::move(payload));
            frame.insert(frame.end(), body.begin(), body.end());
            asio::write(socket_, asio::buffer(frame));
        }

        void send_requests(std::vector<std::uint8_t> bytes) { asio::write(socket_, asio::buffer(bytes)); }

        static std::vector<std::uint8_t> encode(protocol::Command command, nlohmann::json payload)
        {
            const protocol::RequestEnvelope envelope{.command = command, .payload = std::move(payload)};
            return protocol::encode_frame(nlohmann::json(envelope));
        }

        void send_body(std::string_view body) { asio::write(socket_, asio::buffer(body.data(), body.size())); }

        void finish_body() { socket_.shutdown(tcp::socket::shutdown_send); }

        protocol::ResponseEnvelope read_response()
        {
            std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
            asio::read(socket_, asio::buffer(header));
            std::vector<std::uint8_t> payload(protocol::decode_frame_size(header));
            asio::read(socket_, asio::buffer(payload));
            return nlohmann::json::parse(payload.begin(), payload.end()).get<protocol::ResponseEnvelope>();
        }

        bool closed_by_server()
        {
            std::array<std::uint8_t, 1> byte{};
            std::error_code ec;
            asio::read(socket_, asio::buffer(byte), ec);
            return ec == asio::error::eof;
        }

    private:
        asio::io_context io_context_;
        tcp::socket socket_;
    };

    nlohmann::json put_payload(const std::string &name, std::int64_t length)
    {
        return nlohmann::json(protocol::PutFileRequest{.sender = "tester", .name = name, .offset = 0, .length = length});
    }

    void test_known_length_keeps_connection()
    {
        test::TempRoot root("daemon_known");
        RunningServer server(root.path());
        TestClient client(server.port());

        client.send_request(protocol::Command::PutFile, put_payload("hello.txt", 11), "hello world");
        auto response = client.read_response();
        assert(response.kind == protocol::ResponseKind::Ok);
        assert(response.payload.get<protocol::PutFileResponse>().length == 11);
        assert(test::read_file(root.path() / "hello.txt") == "hello world");

        // The body was consumed exactly, so the next frame is read on the same connection.
        client.send_request(protocol::Command::Ping, nlohmann::json::object());
        assert(client.read_response().kind == protocol::ResponseKind::Ok);

        client.send_request(protocol::Command::ListWaiting, nlohmann::json::object());
        response = client.read_response();
        assert(response.kind == protocol::ResponseKind::Ok);
        const auto files = response.payload.at("files").get<std::vector<protocol::WaitingFileInfo>>();
        assert(files.size() == 1);
        assert(files[0].name == "hello.txt");
    }

    void test_put_after_pending_response()
    {
        test::TempRoot root("daemon_pipelined");
        RunningServer server(root.path());
        TestClient client(server.port());

        // A PUT_FILE arriving right behind another request waits for that response to be written.
        auto bytes = TestClient::encode(protocol::Command::Ping, nlohmann::json::object());
        const auto put = TestClient::encode(protocol::Command::PutFile, put_payload("second.bin", 6));
        bytes.insert(bytes.end(), put.begin(), put.end());
        const std::string body = "second";
        bytes.insert(bytes.end(), body.begin(), body.end());
        client.send_requests(std::move(bytes));

        assert(client.read_response().kind == protocol::ResponseKind::Ok);
        const auto response = client.read_response();
        assert(response.kind == protocol::ResponseKind::Ok);
        assert(response.payload.get<protocol::PutFileResponse>().length == 6);
        assert(test::read_file(root.path() / "second.bin") == "second");

        client.send_request(protocol::Command::Ping, nlohmann::json::object());
        assert(client.read_response().kind == protocol::ResponseKind::Ok);
    }

    void test_unknown_length_reads_until_half_close()
    {
        test::TempRoot root("daemon_stream");
        RunningServer server(root.path());
        TestClient client(server.port());

        client.send_request(protocol::Command::PutFile, put_payload("stream.bin", -1), "stream");
        client.send_body("ed");
        client.finish_body();

        const auto response = client.read_response();
        assert(response.kind == protocol::ResponseKind::Ok);
        assert(response.payload.get<protocol::PutFileResponse>().length == 8);
        assert(test::read_file(root.path() / "stream.bin") == "streamed");
        // End of stream was the body's terminator, so the connection cannot carry another frame.
        assert(client.closed_by_server());
    }

    void test_stop_interrupts_stalled_body()
    {
        test::TempRoot root("daemon_stall");
        RunningServer server(root.path());
        TestClient client(server.port());

        client.send_request(protocol::Command::PutFile, put_payload("stall.bin", 100), "0123456789");

        const auto partial = root.path() / "stall.bin.tester.partial";
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!std::filesystem::exists(partial) && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(std::filesystem::exists(partial));

        // Returns even though the peer never finishes the body.
        server.stop();
        assert(std::filesystem::exists(partial));
        assert(!std::filesystem::exists(root.path() / "stall.bin"));
    }

} // namespace

void run_daemon_tests()
{
    spdlog::set_level(spdlog::level::warn);
    test_known_length_keeps_connection();
    test_put_after_pending_response();
    test_unknown_length_reads_until_half_close();
    test_stop_interrupts_stalled_body();
}
