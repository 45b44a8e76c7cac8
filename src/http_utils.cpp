#include "http_utils.h"

#include <fmt/format.h>

namespace msb::http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  if (str.size() <= kMaxLoggedLength) return str;
  return fmt::format("{}...({} bytes)", str.substr(0, kMaxLoggedLength), str.size());
}
std::string FormatOneParam(const httplib::Headers& headers) {
  std::string ret = "{";
  for (auto& [key, value] : headers) {
    if (ret.size() > 1) ret += ", ";
    // never log credentials
    ret += fmt::format("{}: {}", key, key == "Authorization" ? "(hidden)" : value);
  }
  return ret + '}';
}

std::string FormatParam() {
  return "(none)";
}

bool IsOk(int code) {
  return code == 200;
}

} // namespace msb::http_utils
