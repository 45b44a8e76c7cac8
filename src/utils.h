#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <optional>

namespace msb {

// n random lowercase hex digits
std::string RandomHex(size_t n);

// nullopt if unset or empty
std::optional<std::string> GetEnv(const char* name);

// first non-empty of the two, or nullopt
std::optional<std::string> FirstNonEmpty(const std::optional<std::string>&,
                                         const std::optional<std::string>&);

} // namespace msb

#endif  // UTILS_H_
