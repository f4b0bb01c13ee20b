/**
 * Command / Response JSON mapping.
 *
 *   Command:  { "id", "commandType", "parameters": { string: string } }
 *   Response: { "id", "success", "result", "error"?, "payload"? }
 *
 * "payload" is { "kind": "image" | "fileBlob", "data": <base64> }.
 * Older peers send a bare "imageData" string instead; it is read as an image.
 */

#include "protocol/messages.h"

#include "protocol/frame_codec.h"
#include "util/base64.h"
#include "util/uuid.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace lumi {

using json = nlohmann::json;

Command Command::make(std::string type, Parameters parameters) {
    return Command{generate_uuid(), std::move(type), std::move(parameters)};
}

std::string Command::param(const std::string& key) const {
    auto it = parameters.find(key);
    return it == parameters.end() ? std::string{} : it->second;
}

Response Response::ok(std::string id, std::string result) {
    Response r;
    r.id = std::move(id);
    r.success = true;
    r.result = std::move(result);
    return r;
}

Response Response::failure(std::string id, std::string error, std::string result) {
    Response r;
    r.id = std::move(id);
    r.success = false;
    r.result = std::move(result);
    r.error = std::move(error);
    return r;
}

const std::string* Response::file_blob() const {
    if (auto* blob = std::get_if<FileBlobPayload>(&payload)) return &blob->bytes;
    return nullptr;
}

const std::string* Response::image() const {
    if (auto* img = std::get_if<ImagePayload>(&payload)) return &img->bytes;
    return nullptr;
}

void to_json(json& j, const Command& c) {
    j = json{{"id", c.id}, {"commandType", c.type}, {"parameters", c.parameters}};
}

void from_json(const json& j, Command& c) {
    j.at("id").get_to(c.id);
    j.at("commandType").get_to(c.type);
    c.parameters.clear();
    if (auto it = j.find("parameters"); it != j.end() && !it->is_null()) {
        it->get_to(c.parameters);
    }
}

void to_json(json& j, const Response& r) {
    j = json{{"id", r.id}, {"success", r.success}, {"result", r.result}};
    if (r.error) j["error"] = *r.error;

    if (const auto* img = std::get_if<ImagePayload>(&r.payload)) {
        j["payload"] = {{"kind", "image"}, {"data", base64_encode(img->bytes)}};
    } else if (const auto* blob = std::get_if<FileBlobPayload>(&r.payload)) {
        j["payload"] = {{"kind", "fileBlob"}, {"data", base64_encode(blob->bytes)}};
    }
}

void from_json(const json& j, Response& r) {
    j.at("id").get_to(r.id);
    j.at("success").get_to(r.success);
    r.result = j.value("result", std::string{});

    r.error.reset();
    if (auto it = j.find("error"); it != j.end() && it->is_string()) {
        r.error = it->get<std::string>();
    }

    r.payload = std::monostate{};
    if (auto it = j.find("payload"); it != j.end() && it->is_object()) {
        const auto kind = it->value("kind", std::string{});
        auto bytes = base64_decode(it->value("data", std::string{}));
        if (!bytes) throw std::invalid_argument("payload is not valid base64");
        if (kind == "image") {
            r.payload = ImagePayload{std::move(*bytes)};
        } else if (kind == "fileBlob") {
            r.payload = FileBlobPayload{std::move(*bytes)};
        }
    } else if (auto legacy = j.find("imageData"); legacy != j.end() && legacy->is_string()) {
        if (auto bytes = base64_decode(legacy->get<std::string>())) {
            r.payload = ImagePayload{std::move(*bytes)};
        }
    }
}

std::optional<Command> parse_command(const std::string& payload) {
    try {
        return json::parse(payload).get<Command>();
    } catch (const std::exception& e) {
        spdlog::debug("Rejecting command frame: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Response> parse_response(const std::string& payload) {
    try {
        return json::parse(payload).get<Response>();
    } catch (const std::exception& e) {
        spdlog::debug("Rejecting response frame: {}", e.what());
        return std::nullopt;
    }
}

std::string encode_message(const Command& command) {
    return encode_frame(json(command).dump(-1, ' ', false, json::error_handler_t::replace));
}

std::string encode_message(const Response& response) {
    return encode_frame(json(response).dump(-1, ' ', false, json::error_handler_t::replace));
}

} // namespace lumi
