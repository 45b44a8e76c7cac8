#ifndef INCLUDE_MSB_SANDBOX_H_
#define INCLUDE_MSB_SANDBOX_H_

#include <memory>
#include <string>
#include <cstdint>
#include <vector>
#include <optional>

#include <msb/error.h>
#include <msb/config.h>
#include <msb/language.h>
#include <msb/execution.h>

namespace msb {

#define ENUM_LIFECYCLE_STATE_ \
  X(NOT_STARTED, "NotStarted") \
  X(STARTED, "Started")
enum class LifecycleState {
#define X(name, desc) name,
  ENUM_LIFECYCLE_STATE_
#undef X
};

const char* LifecycleStateName(LifecycleState);

struct StartOptions {
  std::optional<std::string> image; // language default if absent
  int memory; // MiB
  double cpus; // rounded half-up before sending

  StartOptions() : memory(512), cpus(1.0) {}
};

// the value sent as config.cpus
int RoundCpus(double cpus);

struct CommandExecution {
  std::string command;
  std::vector<std::string> args;
  int64_t exit_code;
  std::string stdout_text, stderr_text;

  CommandExecution() : exit_code(0) {}
  bool IsSuccess() const { return exit_code == 0; }
};

struct SandboxMetrics {
  std::string name, namespace_name;
  bool running;
  double cpu_usage; // percent
  int64_t memory_usage;
  int64_t disk_usage; // bytes
  int64_t network_usage; // bytes

  SandboxMetrics() :
      running(false), cpu_usage(0), memory_usage(0), disk_usage(0), network_usage(0) {}
};

// A remote sandbox: NotStarted --Start()--> Started --Stop()--> NotStarted.
// Owns the transport shared with every Execution it creates.
// A Sandbox is meant to be used by one thread at a time.
class Sandbox {
  std::shared_ptr<const Language> language_;
  ClientConfig config_;
  std::shared_ptr<RpcTransport> transport_;
  LifecycleState state_;

  void RequireStarted_() const;
 public:
  explicit Sandbox(std::shared_ptr<const Language> language,
                   const SandboxOptions& options = SandboxOptions());
  ~Sandbox();
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox(Sandbox&&) noexcept;
  Sandbox& operator=(Sandbox&&) noexcept;

  const Language& GetLanguage() const { return *language_; }
  const ClientConfig& Config() const { return config_; }
  const SandboxIdentity& Identity() const { return config_.identity; }
  LifecycleState State() const { return state_; }
  bool IsStarted() const { return state_ == LifecycleState::STARTED; }

  // No-op if already started. Throws SandboxStartError.
  void Start(const StartOptions& options = StartOptions());
  // No-op if not started. Throws SandboxStopError; stays Started on failure.
  void Stop();
  // Throws NotStartedError or ExecutionError.
  Execution Run(const std::string& code);
  // Throws NotStartedError or CommandError.
  CommandExecution Command(const std::string& command,
                           const std::vector<std::string>& args = {},
                           std::optional<int> timeout = std::nullopt);
  // Throws NotStartedError or MetricsError.
  SandboxMetrics Metrics();

  // Drop the transport. Executions created from this sandbox can no longer
  // fetch their output; later RPC calls fail with a nested TransportError.
  void ReleaseTransport();
  bool HasTransport() const { return transport_ != nullptr; }
};

// Starts a sandbox on construction; stops it and releases its transport on
// every exit path. If the start fails, teardown still runs and the start
// error is rethrown.
class SandboxSession {
  Sandbox sandbox_;
  int uncaught_on_enter_;
  bool closed_;

  void Teardown_() noexcept;
 public:
  explicit SandboxSession(std::shared_ptr<const Language> language,
                          const SandboxOptions& options = SandboxOptions(),
                          const StartOptions& start_options = StartOptions());
  ~SandboxSession();
  SandboxSession(const SandboxSession&) = delete;
  SandboxSession& operator=(const SandboxSession&) = delete;

  Sandbox& operator*() { return sandbox_; }
  Sandbox* operator->() { return &sandbox_; }
  Sandbox& Get() { return sandbox_; }

  // Stop and release now; a stop failure is thrown as SandboxStopError
  // (the transport is released either way).
  void Close();
};

} // namespace msb

#endif  // INCLUDE_MSB_SANDBOX_H_
