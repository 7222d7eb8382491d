#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "sandbox/execution_backend.hpp"

namespace coderun::sandbox {

// Runs the interpreter directly on the host under rlimits, in a scrubbed
// environment and a throw-away working directory. Shares the host kernel,
// so it is the weaker of the two backends.
class ProcessBackend : public ExecutionBackend {
public:
    explicit ProcessBackend(const config::SandboxConfig& settings);

    std::string Name() const override { return "process"; }
    bool Probe() override;
    RawOutcome Run(const std::string& code,
                   const LanguageSpec& spec,
                   const std::string& stdin_data,
                   std::chrono::milliseconds timeout) override;

private:
    const config::SandboxConfig& settings_;
};

}  // namespace coderun::sandbox
