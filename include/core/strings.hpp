#pragma once

#include <string>

namespace sandtimer::core {

// Strips leading and trailing whitespace as classified by std::isspace.
std::string trim(const std::string& value);

std::string to_lower(const std::string& value);

}  // namespace sandtimer::core
