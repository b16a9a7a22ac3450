#include "control/server.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "control/jsonrpc.hpp"

namespace edge_twin::control {

Server::Server(MethodRegistry methods) : methods_(std::move(methods)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    nlohmann::json envelope;
    try {
      envelope = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
      err << "[control] malformed request: " << ex.what() << '\n';
      out << encode_line(error_response(nullptr, kInternalError, "malformed request")) << std::flush;
      continue;
    }

    bool should_respond = true;
    const auto response = handle_request(envelope, should_respond, err);
    if (should_respond) {
      out << encode_line(response) << std::flush;
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond,
                                      std::ostream& err) const {
  should_respond = true;
  nlohmann::json id = nullptr;
  std::string method = "?";
  try {
    const auto parsed = parse_request(request);
    should_respond = !parsed.is_notification();
    id = parsed.id.value_or(nullptr);
    method = parsed.method;

    if (method == "runtime.methods") {
      return result_response(id, handle_methods_list());
    }

    const auto it = methods_.find(method);
    if (it == methods_.end()) {
      return error_response(id, kMethodNotFound, "method not found: " + method);
    }
    return result_response(id, it->second.handler(parsed.params));
  } catch (const std::invalid_argument& ex) {
    return error_response(id, kInvalidParams, ex.what());
  } catch (const std::exception& ex) {
    err << "[control] " << method << " failed: " << ex.what() << '\n';
    return error_response(id, kInternalError, ex.what());
  }
}

nlohmann::json Server::handle_methods_list() const {
  std::vector<const Method*> sorted;
  sorted.reserve(methods_.size());
  for (const auto& entry : methods_) {
    sorted.push_back(&entry.second);
  }
  std::sort(sorted.begin(), sorted.end(), [](const Method* a, const Method* b) { return a->name < b->name; });

  nlohmann::json methods = nlohmann::json::array();
  for (const Method* method : sorted) {
    methods.push_back({{"name", method->name}, {"description", method->description}});
  }
  return nlohmann::json{{"methods", std::move(methods)}};
}

}  // namespace edge_twin::control
