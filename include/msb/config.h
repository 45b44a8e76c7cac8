#ifndef INCLUDE_MSB_CONFIG_H_
#define INCLUDE_MSB_CONFIG_H_

#include <string>
#include <optional>

namespace msb {

extern const char kDefaultServerUrl[];
extern const char kDefaultNamespace[];

// environment variables consulted when an option is not given
extern const char kServerUrlEnv[];
extern const char kApiKeyEnv[];
extern const char kNamespaceEnv[];

// Caller-supplied options; empty strings are treated as absent.
struct SandboxOptions {
  std::optional<std::string> server_url;
  std::optional<std::string> api_key;
  std::optional<std::string> namespace_name;
  std::optional<std::string> sandbox_name;
};

struct SandboxIdentity {
  std::string namespace_name;
  std::string sandbox_name;
};

struct ClientConfig {
  std::string server_url; // no trailing slash
  std::optional<std::string> api_key;
  SandboxIdentity identity;
};

// Precedence: explicit option > environment variable > built-in default.
// The sandbox name has no environment fallback; it is generated if missing.
ClientConfig ResolveConfig(const SandboxOptions&);

// "sandbox-" followed by 8 random hex digits
std::string GenerateSandboxName();

} // namespace msb

#endif  // INCLUDE_MSB_CONFIG_H_
