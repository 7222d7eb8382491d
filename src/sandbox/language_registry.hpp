#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace coderun::sandbox {

struct LanguageSpec {
    std::string id;
    std::string image;
    std::vector<std::string> command;
    std::string extension;
    std::chrono::seconds timeout{30};
    std::uint64_t memory_limit_bytes = 0;
    bool network_disabled = true;

    std::uint64_t MemoryLimitMb() const { return memory_limit_bytes / (1024 * 1024); }
};

// Immutable after construction; safe to share between threads.
class LanguageRegistry {
public:
    explicit LanguageRegistry(const config::Config& config);

    // Case-insensitive; nullptr when the language is not registered.
    const LanguageSpec* Find(const std::string& language) const;
    bool Has(const std::string& language) const;

    // Entries ordered by identifier.
    const std::vector<LanguageSpec>& List() const { return languages_; }
    std::vector<std::string> Ids() const;

private:
    std::vector<LanguageSpec> languages_;
};

}  // namespace coderun::sandbox
