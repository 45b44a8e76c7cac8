#include <msb/config.h>

#include "utils.h"

namespace msb {

const char kDefaultServerUrl[] = "http://127.0.0.1:5555";
const char kDefaultNamespace[] = "default";

const char kServerUrlEnv[] = "MSB_SERVER_URL";
const char kApiKeyEnv[] = "MSB_API_KEY";
const char kNamespaceEnv[] = "MSB_NAMESPACE";

std::string GenerateSandboxName() {
  return "sandbox-" + RandomHex(8);
}

ClientConfig ResolveConfig(const SandboxOptions& options) {
  ClientConfig ret;
  ret.server_url = FirstNonEmpty(options.server_url, GetEnv(kServerUrlEnv))
      .value_or(kDefaultServerUrl);
  while (ret.server_url.size() && ret.server_url.back() == '/') ret.server_url.pop_back();
  ret.api_key = FirstNonEmpty(options.api_key, GetEnv(kApiKeyEnv));
  ret.identity.namespace_name = FirstNonEmpty(options.namespace_name, GetEnv(kNamespaceEnv))
      .value_or(kDefaultNamespace);
  ret.identity.sandbox_name = FirstNonEmpty(options.sandbox_name, std::nullopt)
      .value_or(GenerateSandboxName());
  return ret;
}

} // namespace msb
