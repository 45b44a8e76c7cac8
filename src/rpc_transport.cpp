#include "rpc_transport.h"

#include <spdlog/spdlog.h>
#include <msb/error.h>

#include "utils.h"
#include "http_utils.h"

namespace msb {

const char kRpcPath[] = "/api/v1/rpc";

std::pair<std::string, std::string> SplitServerUrl(const std::string& url) {
  std::string trimmed = url;
  while (trimmed.size() && trimmed.back() == '/') trimmed.pop_back();
  size_t host_begin = trimmed.find("://");
  host_begin = host_begin == std::string::npos ? 0 : host_begin + 3;
  size_t path_begin = trimmed.find('/', host_begin);
  if (path_begin == std::string::npos) return {trimmed, ""};
  return {trimmed.substr(0, path_begin), trimmed.substr(path_begin)};
}

RpcTransport::RpcTransport(const std::string& server_url,
                           const std::optional<std::string>& api_key) :
    endpoint_(SplitServerUrl(server_url).second + kRpcPath),
    api_key_(api_key),
    cli_(SplitServerUrl(server_url).first) {}

nlohmann::json RpcTransport::Call(const std::string& method, const nlohmann::json& params) {
  using nlohmann::json;
  json request{
      {"jsonrpc", "2.0"},
      {"method", method},
      {"params", params},
      {"id", RandomHex(32)}};
  httplib::Headers headers;
  if (api_key_) headers.emplace("Authorization", "Bearer " + *api_key_);

  std::string body;
  try {
    body = request.dump();
  } catch (json::exception& err) {
    // e.g. params holding invalid UTF-8
    spdlog::warn("JSON encoding error on RPC {}: {}", method, err.what());
    throw TransportError(std::string("Invalid request: ") + err.what());
  }
  auto res = http_utils::HTTPRequest<http_utils::HTTPPost>(
      cli_, endpoint_, headers, body, "application/json");
  if (!res) {
    spdlog::warn("RPC {} failed: {}", method, httplib::to_string(res.error()));
    throw TransportError(httplib::to_string(res.error()));
  }
  spdlog::debug("RPC {} status={} body={}", method, res->status, res->body);
  if (!http_utils::IsOk(res->status)) {
    spdlog::warn("RPC {} failed with HTTP status {}", method, res->status);
    throw TransportError(res->status, res->body);
  }

  json response;
  try {
    response = json::parse(res->body);
  } catch (json::exception& err) {
    spdlog::warn("JSON decoding error on RPC {}: {}", method, err.what());
    throw TransportError(res->status, res->body,
                         std::string("Invalid JSON response: ") + err.what());
  }
  if (!response.is_object()) {
    throw TransportError(res->status, res->body, "Invalid JSON-RPC response: " + res->body);
  }
  if (auto error = response.find("error"); error != response.end() && !error->is_null()) {
    int code = 0;
    std::string message = "Unknown error";
    if (error->is_object()) {
      if (auto it = error->find("code"); it != error->end() && it->is_number_integer()) {
        code = it->get<int>();
      }
      if (auto it = error->find("message"); it != error->end() && it->is_string()) {
        message = it->get<std::string>();
      }
    } else if (error->is_string()) {
      message = error->get<std::string>();
    }
    spdlog::warn("RPC {} returned error {}: {}", method, code, message);
    throw RpcError(code, message);
  }
  auto result = response.find("result");
  if (result == response.end() || result->is_null()) return json::object();
  return *result;
}

} // namespace msb
