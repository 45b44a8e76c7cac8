#include "utils.h"

#include <mutex>
#include <random>
#include <cstdlib>

namespace msb {

std::string RandomHex(size_t n) {
  static std::mutex mtx;
  static std::mt19937_64 gen{std::random_device{}()};
  static const char kDigits[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string ret(n, '0');
  std::lock_guard lck(mtx);
  for (auto& ch : ret) ch = kDigits[dist(gen)];
  return ret;
}

std::optional<std::string> GetEnv(const char* name) {
  const char* val = std::getenv(name);
  if (!val || !*val) return std::nullopt;
  return std::string(val);
}

std::optional<std::string> FirstNonEmpty(const std::optional<std::string>& a,
                                         const std::optional<std::string>& b) {
  if (a && a->size()) return a;
  if (b && b->size()) return b;
  return std::nullopt;
}

} // namespace msb
