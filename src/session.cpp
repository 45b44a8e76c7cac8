#include <msb/sandbox.h>

#include <exception>
#include <spdlog/spdlog.h>

namespace msb {

SandboxSession::SandboxSession(std::shared_ptr<const Language> language,
                               const SandboxOptions& options,
                               const StartOptions& start_options) :
    sandbox_(std::move(language), options),
    uncaught_on_enter_(std::uncaught_exceptions()),
    closed_(false) {
  try {
    sandbox_.Start(start_options);
  } catch (...) {
    // the destructor will not run; the start error stays the one thrown
    Teardown_();
    throw;
  }
}

SandboxSession::~SandboxSession() {
  if (!closed_) Teardown_();
}

void SandboxSession::Teardown_() noexcept {
  closed_ = true;
  const auto& identity = sandbox_.Identity();
  try {
    sandbox_.Stop();
  } catch (const std::exception& err) {
    // never thrown from here; a pending error keeps priority
    if (std::uncaught_exceptions() > uncaught_on_enter_) {
      spdlog::error("Failed to stop sandbox {}/{} while handling another error: {}",
          identity.namespace_name, identity.sandbox_name, err.what());
    } else {
      spdlog::error("Failed to stop sandbox {}/{}: {}",
          identity.namespace_name, identity.sandbox_name, err.what());
    }
  }
  sandbox_.ReleaseTransport();
}

void SandboxSession::Close() {
  if (closed_) return;
  closed_ = true;
  try {
    sandbox_.Stop();
  } catch (...) {
    sandbox_.ReleaseTransport();
    throw;
  }
  sandbox_.ReleaseTransport();
}

} // namespace msb
