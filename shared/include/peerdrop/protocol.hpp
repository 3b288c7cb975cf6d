/**
 * PeerDrop - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/error_codes.hpp"

namespace peerdrop::protocol
{

    enum class Command : std::uint8_t
    {
        PutFile,
        ListPartial,
        HashPartial,
        ListIncoming,
        ListWaiting,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);
    ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                         const std::optional<std::string> &request_id);

    // The raw body follows the request frame: exactly `length` bytes, or until
    // the sender half-closes when `length` is negative.
    struct PutFileRequest
    {
        std::string sender;
        std::string name;
        std::int64_t offset{};
        std::int64_t length{-1};
    };

    void to_json(nlohmann::json &json, const PutFileRequest &request);
    void from_json(const nlohmann::json &json, PutFileRequest &request);

    struct PutFileResponse
    {
        std::int64_t length{};
    };

    void to_json(nlohmann::json &json, const PutFileResponse &response);
    void from_json(const nlohmann::json &json, PutFileResponse &response);

    struct PartialFileRequest
    {
        std::string sender;
        std::string name;
    };

    void to_json(nlohmann::json &json, const PartialFileRequest &request);
    void from_json(const nlohmann::json &json, PartialFileRequest &request);

    struct PartialListResponse
    {
        std::vector<std::string> names;
    };

    void to_json(nlohmann::json &json, const PartialListResponse &response);
    void from_json(const nlohmann::json &json, PartialListResponse &response);

    struct PartialHashResponse
    {
        std::uint64_t size{};
        std::string digest;
    };

    void to_json(nlohmann::json &json, const PartialHashResponse &response);
    void from_json(const nlohmann::json &json, PartialHashResponse &response);

    struct IncomingTransferInfo
    {
        std::string sender;
        std::string name;
        std::uint64_t started{};
        std::int64_t declared_length{-1};
        std::int64_t copied{};
        bool done{};
    };

    void to_json(nlohmann::json &json, const IncomingTransferInfo &info);
    void from_json(const nlohmann::json &json, IncomingTransferInfo &info);

    struct WaitingFileInfo
    {
        std::string name;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const WaitingFileInfo &info);
    void from_json(const nlohmann::json &json, WaitingFileInfo &info);

} // namespace peerdrop::protocol
