#pragma once

#include <string>
#include <vector>

namespace coderun::utils {

std::string Join(const std::vector<std::string>& items, const std::string& delimiter);

std::string ToLower(std::string value);

std::string Trim(const std::string& value);

// Process-unique token usable in file and container names.
std::string MakeUniqueToken(const std::string& prefix);

}  // namespace coderun::utils
