#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace edge_twin::control {

inline constexpr const char* kJsonRpcVersion = "2.0";

inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

// A request envelope that cannot be dispatched. Reported as invalid params.
class RequestError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct JsonRpcRequest {
  std::string method;
  // Always an object; absent params become {}.
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  bool is_notification() const noexcept { return !id.has_value(); }
};

JsonRpcRequest parse_request(const nlohmann::json& envelope);

nlohmann::json result_response(const nlohmann::json& id, nlohmann::json result);
nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message);

// One response line. Invalid UTF-8 in strings (host names, backend stderr) is
// replaced rather than thrown.
std::string encode_line(const nlohmann::json& response);

}  // namespace edge_twin::control
