#include "sandbox/security_filter.hpp"

#include "utils/common.hpp"

namespace coderun::sandbox {

const char* ToString(FilterCategory category) {
    switch (category) {
        case FilterCategory::kDynamicExecution: return "dynamic_execution";
        case FilterCategory::kProcessEscape: return "process_escape";
        case FilterCategory::kFilesystemAccess: return "filesystem_access";
        case FilterCategory::kInteractiveInput: return "interactive_input";
        case FilterCategory::kDestructiveShell: return "destructive_shell";
    }
    return "unknown";
}

std::string ScanResult::Reason() const {
    if (allowed) {
        return {};
    }
    return std::string("code blocked: contains dangerous pattern \"") + pattern +
           "\" (" + ToString(category) + ")";
}

SecurityFilter::SecurityFilter()
    : patterns_(DefaultPatterns()) {}

SecurityFilter::SecurityFilter(std::vector<BlockedPattern> patterns)
    : patterns_(std::move(patterns)) {
    for (auto& entry : patterns_) {
        entry.pattern = utils::ToLower(entry.pattern);
    }
}

std::vector<BlockedPattern> SecurityFilter::DefaultPatterns() {
    using C = FilterCategory;
    return {
        {C::kProcessEscape, "import os"},
        {C::kProcessEscape, "import subprocess"},
        {C::kProcessEscape, "import sys"},
        {C::kProcessEscape, "from os"},
        {C::kProcessEscape, "from subprocess"},
        {C::kProcessEscape, "from sys"},
        {C::kProcessEscape, "os.system"},
        {C::kProcessEscape, "child_process"},
        {C::kProcessEscape, "process.env"},
        {C::kProcessEscape, "process.binding"},
        {C::kDynamicExecution, "__import__"},
        {C::kDynamicExecution, "eval("},
        {C::kDynamicExecution, "exec("},
        {C::kDynamicExecution, "compile("},
        {C::kDynamicExecution, "new function("},
        {C::kFilesystemAccess, "open("},
        {C::kFilesystemAccess, "file("},
        {C::kFilesystemAccess, "require('fs')"},
        {C::kFilesystemAccess, "require(\"fs\")"},
        {C::kInteractiveInput, "raw_input("},
        {C::kInteractiveInput, "input("},
        {C::kDestructiveShell, "rm -rf"},
        {C::kDestructiveShell, "sudo"},
        {C::kDestructiveShell, "wget"},
        {C::kDestructiveShell, "curl"},
        {C::kDestructiveShell, "mkfs"},
        {C::kDestructiveShell, "shutdown"},
        {C::kDestructiveShell, "reboot"},
        {C::kDestructiveShell, ":(){"},
        {C::kDestructiveShell, "chmod 777"},
        {C::kDestructiveShell, "dd if="}
    };
}

ScanResult SecurityFilter::Scan(const std::string& code, const std::string& language) const {
    // Every pattern applies to every language.
    (void)language;
    ScanResult result{};
    const auto lowered = utils::ToLower(code);
    for (const auto& entry : patterns_) {
        if (lowered.find(entry.pattern) != std::string::npos) {
            result.allowed = false;
            result.category = entry.category;
            result.pattern = entry.pattern;
            return result;
        }
    }
    return result;
}

}  // namespace coderun::sandbox
