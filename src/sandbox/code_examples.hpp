#pragma once

#include <map>
#include <string>

namespace coderun::sandbox {

// Static sample programs per language, shown to users; never executed here.
const std::map<std::string, std::string>& BuiltinExamples();

}  // namespace coderun::sandbox
