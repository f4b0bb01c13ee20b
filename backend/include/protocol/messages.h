#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

#include <nlohmann/json.hpp>

namespace lumi {

using Parameters = std::map<std::string, std::string>;

/// Binary payload carried by a screenshot-style response.
struct ImagePayload {
    std::string bytes;
};

/// Binary payload carried by a sync transfer.
struct FileBlobPayload {
    std::string bytes;
};

using Payload = std::variant<std::monostate, ImagePayload, FileBlobPayload>;

struct Command {
    std::string id;
    std::string type;
    Parameters parameters;

    /// Build a command with a freshly generated id.
    static Command make(std::string type, Parameters parameters = {});

    /// Convenience lookup, empty when the key is absent.
    [[nodiscard]] std::string param(const std::string& key) const;
};

struct Response {
    std::string id;
    bool success = false;
    std::string result;
    std::optional<std::string> error;
    Payload payload;

    static Response ok(std::string id, std::string result);
    static Response failure(std::string id, std::string error, std::string result = {});

    /// Bytes of a fileBlob payload, if that is what the response carries.
    [[nodiscard]] const std::string* file_blob() const;
    [[nodiscard]] const std::string* image() const;
};

void to_json(nlohmann::json& j, const Command& c);
void from_json(const nlohmann::json& j, Command& c);
void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

/// Parse a frame payload. Empty on invalid JSON or a schema mismatch.
std::optional<Command> parse_command(const std::string& payload);
std::optional<Response> parse_response(const std::string& payload);

/// Serialize and frame in one step.
std::string encode_message(const Command& command);
std::string encode_message(const Response& response);

/// Completion for a sent command: an error code, or the peer's Response.
/// A Response with success == false is an application-level result, not an error.
using ResponseHandler = std::function<void(std::error_code, Response)>;

/// Generic "run this command remotely" seam shared by the bridge and the sync engine.
using CommandExecutor = std::function<void(const std::string& type,
                                           const Parameters& parameters,
                                           std::chrono::milliseconds timeout,
                                           ResponseHandler handler)>;

} // namespace lumi
