#pragma once
#include <string>

namespace helm::util {

// Returns prefix followed by 16 random lowercase hex characters,
// e.g. generate_id("env_") -> "env_3fa85f6457174562".
std::string generate_id(const std::string& prefix);

} // namespace helm::util
