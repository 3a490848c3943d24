#include "core/strings.hpp"

#include <algorithm>
#include <cctype>

namespace sandtimer::core {

namespace {

bool is_space(const unsigned char c) { return std::isspace(c) != 0; }

}  // namespace

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace sandtimer::core
