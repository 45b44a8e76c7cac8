#include <msb/execution.h>

#include <spdlog/spdlog.h>
#include <msb/error.h>

#include "rpc_transport.h"

namespace msb {

const char kStdout[] = "stdout";
const char kStderr[] = "stderr";

Execution::Execution(const SandboxIdentity& identity, const std::string& execution_id,
                     std::weak_ptr<RpcTransport> transport) :
    identity_(identity),
    execution_id_(execution_id),
    transport_(std::move(transport)),
    output_fetched_(false) {}

void Execution::FetchOutput_() {
  using nlohmann::json;
  if (output_fetched_) return;
  // no id from the server means nothing to fetch
  if (execution_id_.empty()) {
    output_fetched_ = true;
    return;
  }
  json params{
      {"sandbox", identity_.sandbox_name},
      {"namespace", identity_.namespace_name},
      {"execution_id", execution_id_}};
  auto transport = transport_.lock();
  output_lines_ = CallAndParse<OutputFetchError>(
      transport.get(), "sandbox.repl.getOutput", params, [](const json& result) {
    std::vector<OutputLine> lines;
    if (!result.is_object()) return lines;
    auto it = result.find("lines");
    if (it == result.end() || it->is_null()) return lines;
    for (auto& item : it->get_ref<const json::array_t&>()) {
      lines.push_back({ValueOr<std::string>(item, "stream", ""),
                       ValueOr<std::string>(item, "text", "")});
    }
    return lines;
  });
  output_fetched_ = true;
  spdlog::debug("Fetched {} output lines of execution {}", output_lines_.size(), execution_id_);
}

std::string Execution::JoinStream_(const char* stream) {
  FetchOutput_();
  std::string ret;
  for (auto& line : output_lines_) {
    if (line.stream == stream) ret += line.text + '\n';
  }
  if (ret.size() && ret.back() == '\n') ret.pop_back();
  return ret;
}

std::string Execution::Output() {
  return JoinStream_(kStdout);
}

std::string Execution::Error() {
  return JoinStream_(kStderr);
}

bool Execution::HasError() {
  FetchOutput_();
  for (auto& line : output_lines_) {
    if (line.stream == kStderr) return true;
  }
  return false;
}

const std::vector<OutputLine>& Execution::Lines() {
  FetchOutput_();
  return output_lines_;
}

} // namespace msb
