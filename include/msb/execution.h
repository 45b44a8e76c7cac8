#ifndef INCLUDE_MSB_EXECUTION_H_
#define INCLUDE_MSB_EXECUTION_H_

#include <memory>
#include <string>
#include <vector>

#include <msb/config.h>

namespace msb {

class Sandbox;
class RpcTransport;

extern const char kStdout[];
extern const char kStderr[];

struct OutputLine {
  std::string stream; // kStdout or kStderr
  std::string text;
};

// One piece of code submitted by Sandbox::Run.
// Output is fetched from the server on first access and cached afterwards.
class Execution {
  SandboxIdentity identity_;
  std::string execution_id_;
  // owned by the sandbox; expires when its transport is released
  std::weak_ptr<RpcTransport> transport_;
  bool output_fetched_;
  std::vector<OutputLine> output_lines_;

  Execution(const SandboxIdentity& identity, const std::string& execution_id,
            std::weak_ptr<RpcTransport> transport);

  void FetchOutput_();
  std::string JoinStream_(const char* stream);
 public:
  const std::string& ExecutionId() const { return execution_id_; }
  const SandboxIdentity& Identity() const { return identity_; }
  bool OutputFetched() const { return output_fetched_; }

  // stdout lines joined by '\n'
  std::string Output();
  // stderr lines, formatted like Output()
  std::string Error();
  bool HasError();
  const std::vector<OutputLine>& Lines();

  friend class Sandbox;
};

} // namespace msb

#endif  // INCLUDE_MSB_EXECUTION_H_
