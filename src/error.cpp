#include <msb/error.h>

namespace msb {

TransportError::TransportError(int status, const std::string& body, const std::string& what) :
    Error(what), status_(status), body_(body) {}

TransportError::TransportError(int status, const std::string& body) :
    TransportError(status, body, "HTTP " + std::to_string(status) + ": " + body) {}

TransportError::TransportError(const std::string& what) :
    TransportError(0, "", "Failed to communicate with server: " + what) {}

RpcError::RpcError(int code, const std::string& message) :
    Error("Server error: " + message), code_(code), message_(message) {}

NotStartedError::NotStartedError() :
    Error("Sandbox is not started. Call Start() first.") {}

} // namespace msb
