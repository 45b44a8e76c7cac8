#include <msb/sandbox.h>

#include <cmath>
#include <spdlog/spdlog.h>

#include "rpc_transport.h"

namespace msb {

const char* LifecycleStateName(LifecycleState state) {
  switch (state) {
#define X(name, desc) case LifecycleState::name: return desc;
    ENUM_LIFECYCLE_STATE_
#undef X
  }
  __builtin_unreachable();
}

// half-up: 1.5 -> 2, 2.5 -> 3
int RoundCpus(double cpus) {
  return static_cast<int>(std::floor(cpus + 0.5));
}

Sandbox::Sandbox(std::shared_ptr<const Language> language, const SandboxOptions& options) :
    language_(std::move(language)),
    config_(ResolveConfig(options)),
    transport_(std::make_shared<RpcTransport>(config_.server_url, config_.api_key)),
    state_(LifecycleState::NOT_STARTED) {
  spdlog::debug("Sandbox {}/{} on {}, language {}", config_.identity.namespace_name,
      config_.identity.sandbox_name, config_.server_url, language_->Tag());
}

Sandbox::~Sandbox() {
  if (IsStarted()) {
    spdlog::warn("Sandbox {}/{} destroyed while started", config_.identity.namespace_name,
        config_.identity.sandbox_name);
  }
}

Sandbox::Sandbox(Sandbox&& other) noexcept :
    language_(std::move(other.language_)),
    config_(std::move(other.config_)),
    transport_(std::move(other.transport_)),
    state_(other.state_) {
  other.state_ = LifecycleState::NOT_STARTED;
}

Sandbox& Sandbox::operator=(Sandbox&& other) noexcept {
  if (this == &other) return *this;
  if (IsStarted()) {
    spdlog::warn("Sandbox {}/{} overwritten while started", config_.identity.namespace_name,
        config_.identity.sandbox_name);
  }
  language_ = std::move(other.language_);
  config_ = std::move(other.config_);
  transport_ = std::move(other.transport_);
  state_ = other.state_;
  other.state_ = LifecycleState::NOT_STARTED;
  return *this;
}

void Sandbox::RequireStarted_() const {
  if (!IsStarted()) throw NotStartedError();
}

void Sandbox::Start(const StartOptions& options) {
  using nlohmann::json;
  if (IsStarted()) return;
  std::string image = options.image && options.image->size() ?
      *options.image : language_->DefaultImage();
  json params{
      {"namespace", config_.identity.namespace_name},
      {"sandbox", config_.identity.sandbox_name},
      {"config", {
          {"image", image},
          {"memory", options.memory},
          {"cpus", RoundCpus(options.cpus)}}}};
  CallAndParse<SandboxStartError>(transport_.get(), "sandbox.start", params, [](const json&) {});
  state_ = LifecycleState::STARTED;
  spdlog::info("Sandbox {}/{} started (image={}, memory={}, cpus={})",
      config_.identity.namespace_name, config_.identity.sandbox_name, image,
      options.memory, RoundCpus(options.cpus));
}

void Sandbox::Stop() {
  using nlohmann::json;
  if (!IsStarted()) return;
  json params{
      {"namespace", config_.identity.namespace_name},
      {"sandbox", config_.identity.sandbox_name}};
  CallAndParse<SandboxStopError>(transport_.get(), "sandbox.stop", params, [](const json&) {});
  state_ = LifecycleState::NOT_STARTED;
  spdlog::info("Sandbox {}/{} stopped", config_.identity.namespace_name,
      config_.identity.sandbox_name);
}

Execution Sandbox::Run(const std::string& code) {
  using nlohmann::json;
  RequireStarted_();
  json params{
      {"sandbox", config_.identity.sandbox_name},
      {"namespace", config_.identity.namespace_name},
      {"language", language_->Tag()},
      {"code", code}};
  // a non-string id is treated like a missing one
  std::string execution_id = CallAndParse<ExecutionError>(
      transport_.get(), "sandbox.repl.run", params, [](const json& result) {
    if (!result.is_object()) return std::string();
    auto it = result.find("execution_id");
    if (it == result.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
  });
  spdlog::info("Execution {} submitted to sandbox {}", execution_id,
      config_.identity.sandbox_name);
  return Execution(config_.identity, execution_id, transport_);
}

CommandExecution Sandbox::Command(const std::string& command,
                                  const std::vector<std::string>& args,
                                  std::optional<int> timeout) {
  using nlohmann::json;
  RequireStarted_();
  json params{
      {"sandbox", config_.identity.sandbox_name},
      {"namespace", config_.identity.namespace_name},
      {"command", command},
      {"args", args}};
  if (timeout) params["timeout"] = *timeout;
  return CallAndParse<CommandError>(
      transport_.get(), "sandbox.command.run", params, [&](const json& result) {
    CommandExecution ret;
    ret.command = ValueOr<std::string>(result, "command", command);
    ret.args = ValueOr<std::vector<std::string>>(result, "args", args);
    ret.exit_code = ValueOr<int64_t>(result, "exit_code", 0);
    ret.stdout_text = ValueOr<std::string>(result, "stdout", "");
    ret.stderr_text = ValueOr<std::string>(result, "stderr", "");
    spdlog::debug("Command {} in sandbox {} exited with {}", command,
        config_.identity.sandbox_name, ret.exit_code);
    return ret;
  });
}

SandboxMetrics Sandbox::Metrics() {
  using nlohmann::json;
  RequireStarted_();
  json params{
      {"sandbox", config_.identity.sandbox_name},
      {"namespace", config_.identity.namespace_name}};
  return CallAndParse<MetricsError>(
      transport_.get(), "sandbox.metrics.get", params, [this](const json& result) {
    SandboxMetrics ret;
    ret.name = ValueOr<std::string>(result, "name", config_.identity.sandbox_name);
    ret.namespace_name = ValueOr<std::string>(result, "namespace", config_.identity.namespace_name);
    ret.running = ValueOr<bool>(result, "running", false);
    ret.cpu_usage = ValueOr<double>(result, "cpu_usage", 0);
    ret.memory_usage = ValueOr<int64_t>(result, "memory_usage", 0);
    ret.disk_usage = ValueOr<int64_t>(result, "disk_usage", 0);
    ret.network_usage = ValueOr<int64_t>(result, "network_usage", 0);
    return ret;
  });
}

void Sandbox::ReleaseTransport() {
  if (!transport_) return;
  spdlog::debug("Release transport of sandbox {}", config_.identity.sandbox_name);
  transport_.reset();
}

} // namespace msb
