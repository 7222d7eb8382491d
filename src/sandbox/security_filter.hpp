#pragma once

#include <string>
#include <vector>

namespace coderun::sandbox {

enum class FilterCategory {
    kDynamicExecution,
    kProcessEscape,
    kFilesystemAccess,
    kInteractiveInput,
    kDestructiveShell
};

const char* ToString(FilterCategory category);

struct BlockedPattern {
    FilterCategory category;
    std::string pattern;
};

struct ScanResult {
    bool allowed = true;
    FilterCategory category = FilterCategory::kDynamicExecution;
    std::string pattern;

    std::string Reason() const;
};

// Case-insensitive substring scan of the whole source text. Comments and
// string literals are scanned too, so false positives are expected.
//
// This only turns away obviously unsafe submissions before paying for an
// execution environment. The backend isolation is the actual trust
// boundary; passing the scan does not make code safe to run unsandboxed.
class SecurityFilter {
public:
    SecurityFilter();
    explicit SecurityFilter(std::vector<BlockedPattern> patterns);

    ScanResult Scan(const std::string& code, const std::string& language) const;

    const std::vector<BlockedPattern>& Patterns() const { return patterns_; }

    static std::vector<BlockedPattern> DefaultPatterns();

private:
    std::vector<BlockedPattern> patterns_;
};

}  // namespace coderun::sandbox
