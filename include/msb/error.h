#ifndef INCLUDE_MSB_ERROR_H_
#define INCLUDE_MSB_ERROR_H_

#include <string>
#include <stdexcept>

namespace msb {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Non-200 HTTP status or network-level failure.
// status is 0 if no HTTP response was received.
class TransportError : public Error {
  int status_;
  std::string body_;
 public:
  TransportError(int status, const std::string& body, const std::string& what);
  // HTTP error; body is kept verbatim
  TransportError(int status, const std::string& body);
  // network error (connection refused, DNS, TLS, ...)
  explicit TransportError(const std::string& what);

  int Status() const { return status_; }
  const std::string& Body() const { return body_; }
};

// HTTP 200 with an "error" member in the response
class RpcError : public Error {
  int code_;
  std::string message_;
 public:
  RpcError(int code, const std::string& message);

  int Code() const { return code_; }
  const std::string& Message() const { return message_; }
};

class NotStartedError : public Error {
 public:
  NotStartedError();
};

// Base of the call-specific wrappers. They are thrown through
// std::throw_with_nested, so the TransportError / RpcError that caused them
// can be recovered with std::rethrow_if_nested.
class CallError : public Error {
 protected:
  CallError(const char* context, const Error& cause) :
      Error(std::string(context) + ": " + cause.what()) {}
};

#define ENUM_CALL_ERROR_ \
  X(SandboxStartError, "Failed to start sandbox") \
  X(SandboxStopError, "Failed to stop sandbox") \
  X(ExecutionError, "Failed to execute code") \
  X(OutputFetchError, "Failed to get output") \
  X(CommandError, "Failed to run command") \
  X(MetricsError, "Failed to get metrics")
#define X(name, context) \
class name : public CallError { \
 public: \
  explicit name(const Error& cause) : CallError(context, cause) {} \
};
ENUM_CALL_ERROR_
#undef X

} // namespace msb

#endif  // INCLUDE_MSB_ERROR_H_
