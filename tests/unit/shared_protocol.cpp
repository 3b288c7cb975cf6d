#include <algorithm>
#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/crypto.hpp"
#include "peerdrop/error_codes.hpp"
#include "peerdrop/framing.hpp"
#include "peerdrop/io.hpp"
#include "peerdrop/protocol.hpp"

using namespace peerdrop;
using namespace peerdrop::protocol;

void run_server_component_tests();
void run_put_file_tests();
void run_daemon_tests();

namespace
{

    void test_request_roundtrip()
    {
        PutFileRequest put{.sender = "alice", .name = "photo.jpg", .offset = 512, .length = 1000};
        RequestEnvelope envelope{};
        envelope.command = Command::PutFile;
        envelope.payload = put;
        envelope.request_id = std::string("req-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "PUT_FILE");
        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::PutFile);
        assert(decoded.request_id == envelope.request_id);

        const auto request = decoded.payload.get<PutFileRequest>();
        assert(request.sender == "alice");
        assert(request.name == "photo.jpg");
        assert(request.offset == 512);
        assert(request.length == 1000);
    }

    void test_put_request_defaults()
    {
        const auto request = nlohmann::json{{"name", "notes.txt"}}.get<PutFileRequest>();
        assert(request.sender.empty());
        assert(request.offset == 0);
        assert(request.length == -1);

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "UPLOAD"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_error_response()
    {
        const auto envelope = make_error_response(ErrorCode::AlreadyInProgress, "transfer already in progress",
                                                  std::string("req-9"));
        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::AlreadyInProgress));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::AlreadyInProgress);
        assert(decoded.message == "transfer already in progress");
        assert(decoded.request_id == std::optional<std::string>("req-9"));
    }

    void test_listing_payloads()
    {
        std::vector<IncomingTransferInfo> transfers;
        transfers.push_back(IncomingTransferInfo{
            .sender = "bob",
            .name = "video.mp4",
            .started = 1700000000,
            .declared_length = -1,
            .copied = 4096,
            .done = false,
        });
        nlohmann::json payload;
        payload["transfers"] = transfers;
        const auto response = make_ok_response(payload, std::nullopt);
        const auto decoded = nlohmann::json(response).get<ResponseEnvelope>();
        const auto infos = decoded.payload.at("transfers").get<std::vector<IncomingTransferInfo>>();
        assert(infos.size() == 1);
        assert(infos[0].sender == "bob");
        assert(infos[0].declared_length == -1);
        assert(infos[0].copied == 4096);
        assert(!decoded.request_id);

        const PartialHashResponse hash{.size = 10, .digest = "abcd"};
        const auto hash_decoded = nlohmann::json(hash).get<PartialHashResponse>();
        assert(hash_decoded.size == 10);
        assert(hash_decoded.digest == "abcd");
    }

    void test_error_code_labels()
    {
        assert(to_string(ErrorCode::LengthMismatch) == "length_mismatch");
        assert(to_string(ErrorCode::TooManyCollisions) == "too_many_collisions");
        assert(error_code_from_int(to_int(ErrorCode::InvalidOffset)) == ErrorCode::InvalidOffset);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_framing()
    {
        const nlohmann::json message{{"cmd", "PING"}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(frame.begin(), kFrameHeaderSize, header.begin());
        assert(decode_frame_size(header) == frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial);

        const auto decoded = try_decode_frame(frame);
        assert(decoded);
        assert(decoded->message == message);
        assert(decoded->bytes_consumed == frame.size());

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_size(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_crypto()
    {
        const std::string text = "abc";
        const auto digest = crypto::sha256_bytes(std::as_bytes(std::span<const char>(text.data(), text.size())));
        assert(crypto::to_hex(digest) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        std::istringstream stream(text);
        assert(crypto::sha256_stream(stream) == digest);

        const auto file_path = std::filesystem::temp_directory_path() / "peerdrop_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file << text;
        }
        assert(crypto::sha256_file(file_path) == digest);
        std::filesystem::remove(file_path);

        bool caught = false;
        try
        {
            (void)crypto::sha256_file(file_path);
        }
        catch (const std::system_error &error)
        {
            caught = true;
            assert(std::string(error.what()).find("peerdrop_crypto_test") == std::string::npos);
        }
        assert(caught);
    }

    void test_stream_copy()
    {
        class StringWriter final : public io::Writer
        {
        public:
            std::size_t write(std::span<const std::byte> data) override
            {
                out.append(reinterpret_cast<const char *>(data.data()), data.size());
                return data.size();
            }
            std::string out;
        };

        const std::string content(200 * 1024, 'x');
        std::istringstream input(content);
        io::StreamReader reader(input);
        StringWriter writer;
        assert(io::copy(writer, reader) == static_cast<std::int64_t>(content.size()));
        assert(writer.out == content);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_put_request_defaults();
        test_error_response();
        test_listing_payloads();
        test_error_code_labels();
        test_framing();
        test_crypto();
        test_stream_copy();
        run_server_component_tests();
        run_put_file_tests();
        run_daemon_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
