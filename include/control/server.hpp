#pragma once

#include <iosfwd>

#include "control/methods.hpp"

namespace edge_twin::control {

// Line-delimited JSON-RPC 2.0. run() returns at end of input.
class Server {
 public:
  explicit Server(MethodRegistry methods);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Handler failures are logged to `err`.
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond, std::ostream& err) const;

 private:
  nlohmann::json handle_methods_list() const;

  MethodRegistry methods_;
};

}  // namespace edge_twin::control
