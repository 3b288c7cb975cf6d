#include "peerdrop/protocol.hpp"

#include <array>
#include <stdexcept>

namespace peerdrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 6> kCommandMappings{{
            {Command::PutFile, "PUT_FILE"},
            {Command::ListPartial, "LIST_PARTIAL"},
            {Command::HashPartial, "HASH_PARTIAL"},
            {Command::ListIncoming, "LIST_INCOMING"},
            {Command::ListWaiting, "LIST_WAITING"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                         const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = request_id;
        return envelope;
    }

    void to_json(nlohmann::json &json, const PutFileRequest &request)
    {
        json = {
            {"sender", request.sender},
            {"name", request.name},
            {"offset", request.offset},
            {"length", request.length},
        };
    }

    void from_json(const nlohmann::json &json, PutFileRequest &request)
    {
        request.sender = json.value("sender", std::string{});
        request.name = json.at("name").get<std::string>();
        request.offset = json.value("offset", std::int64_t{0});
        request.length = json.value("length", std::int64_t{-1});
    }

    void to_json(nlohmann::json &json, const PutFileResponse &response)
    {
        json = {{"length", response.length}};
    }

    void from_json(const nlohmann::json &json, PutFileResponse &response)
    {
        response.length = json.at("length").get<std::int64_t>();
    }

    void to_json(nlohmann::json &json, const PartialFileRequest &request)
    {
        json = {{"sender", request.sender}};
        if (!request.name.empty())
        {
            json["name"] = request.name;
        }
    }

    void from_json(const nlohmann::json &json, PartialFileRequest &request)
    {
        request.sender = json.value("sender", std::string{});
        request.name = json.value("name", std::string{});
    }

    void to_json(nlohmann::json &json, const PartialListResponse &response)
    {
        json = {{"names", response.names}};
    }

    void from_json(const nlohmann::json &json, PartialListResponse &response)
    {
        response.names = json.value("names", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const PartialHashResponse &response)
    {
        json = {
            {"size", response.size},
            {"digest", response.digest},
        };
    }

    void from_json(const nlohmann::json &json, PartialHashResponse &response)
    {
        response.size = json.value("size", 0ULL);
        response.digest = json.at("digest").get<std::string>();
    }

    void to_json(nlohmann::json &json, const IncomingTransferInfo &info)
    {
        json = {
            {"sender", info.sender},
            {"name", info.name},
            {"started", info.started},
            {"declared_length", info.declared_length},
            {"copied", info.copied},
            {"done", info.done},
        };
    }

    void from_json(const nlohmann::json &json, IncomingTransferInfo &info)
    {
        info.sender = json.value("sender", std::string{});
        info.name = json.at("name").get<std::string>();
        info.started = json.value("started", 0ULL);
        info.declared_length = json.value("declared_length", std::int64_t{-1});
        info.copied = json.value("copied", std::int64_t{0});
        info.done = json.value("done", false);
    }

    void to_json(nlohmann::json &json, const WaitingFileInfo &info)
    {
        json = {
            {"name", info.name},
            {"size", info.size},
        };
    }

    void from_json(const nlohmann::json &json, WaitingFileInfo &info)
    {
        info.name = json.at("name").get<std::string>();
        info.size = json.value("size", 0ULL);
    }

} // namespace peerdrop::protocol
