#include "topology/naming.hpp"

#include <cctype>

namespace netstack::topology {

bool ValidatePrefix(std::string_view prefix, std::string& error) {
  error.clear();
  if (prefix.empty()) {
    error = "prefix cannot be empty";
    return false;
  }
  if (prefix.size() > kMaxPrefixLength) {
    error = "prefix must be at most " + std::to_string(kMaxPrefixLength) + " characters";
    return false;
  }
  for (const char c : prefix) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '-') {
      error = "prefix '" + std::string(prefix) +
              "' may only contain ASCII letters, digits and '-'";
      return false;
    }
  }
  return true;
}

} // namespace netstack::topology
