#ifndef RPC_TRANSPORT_H_
#define RPC_TRANSPORT_H_

#include <string>
#include <utility>
#include <exception>
#include <optional>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <msb/error.h>

namespace msb {

extern const char kRpcPath[];

// JSON-RPC 2.0 over HTTP POST to <server_url>/api/v1/rpc.
// One call is one HTTP request; nothing is retried.
class RpcTransport {
  std::string endpoint_; // path part, e.g. /api/v1/rpc
  std::optional<std::string> api_key_;
  httplib::Client cli_;

 public:
  // server_url is scheme://host[:port][/prefix]
  RpcTransport(const std::string& server_url, const std::optional<std::string>& api_key);

  const std::string& Endpoint() const { return endpoint_; }

  // Returns "result" of the response, or an empty object if absent.
  // Throws TransportError or RpcError.
  nlohmann::json Call(const std::string& method, const nlohmann::json& params);
};

// Splits scheme://host[:port][/prefix] into the part httplib::Client accepts
// and the path prefix; trailing slashes are dropped.
std::pair<std::string, std::string> SplitServerUrl(const std::string& url);

// Absent or null members read as the default; a member of the wrong type
// throws nlohmann::json::type_error.
template <class T>
T ValueOr(const nlohmann::json& obj, const char* key, T def) {
  if (!obj.is_object()) return def;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return def;
  return it->get<T>();
}

// Calls method and hands its result to parse. Every TransportError or RpcError,
// a malformed result and a released transport (nullptr) included, is thrown
// nested inside WrapError.
template <class WrapError, class Parse>
auto CallAndParse(RpcTransport* transport, const std::string& method,
                  const nlohmann::json& params, Parse&& parse) {
  try {
    if (!transport) throw TransportError("transport released");
    nlohmann::json result = transport->Call(method, params);
    try {
      return parse(result);
    } catch (nlohmann::json::exception& err) {
      throw TransportError(200, result.dump(),
                           "Malformed result of " + method + ": " + err.what());
    }
  } catch (const Error& err) {
    std::throw_with_nested(WrapError(err));
  }
}

} // namespace msb

#endif  // RPC_TRANSPORT_H_
