#include "control/jsonrpc.hpp"

#include <utility>

namespace edge_twin::control {
namespace {

const nlohmann::json& require_member(const nlohmann::json& envelope, const char* key) {
  const auto it = envelope.find(key);
  if (it == envelope.end()) {
    throw RequestError(std::string(key) + " is required");
  }
  return *it;
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& envelope) {
  if (!envelope.is_object()) {
    throw RequestError("request must be a JSON object");
  }

  if (require_member(envelope, "jsonrpc") != kJsonRpcVersion) {
    throw RequestError("jsonrpc must be \"2.0\"");
  }

  const auto& method = require_member(envelope, "method");
  if (!method.is_string() || method.get_ref<const std::string&>().empty()) {
    throw RequestError("method must be a non-empty string");
  }

  JsonRpcRequest request{.method = method.get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  if (const auto id = envelope.find("id"); id != envelope.end()) {
    if (!id->is_null() && !id->is_string() && !id->is_number_integer()) {
      throw RequestError("id must be a string, an integer or null");
    }
    request.id = *id;
  }

  if (const auto params = envelope.find("params"); params != envelope.end() && !params->is_null()) {
    if (!params->is_object()) {
      throw RequestError("params must be an object");
    }
    request.params = *params;
  }

  return request;
}

nlohmann::json result_response(const nlohmann::json& id, nlohmann::json result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json error_response(const nlohmann::json& id, const int code, const std::string& message) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string encode_line(const nlohmann::json& response) {
  std::string line = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

}  // namespace edge_twin::control
