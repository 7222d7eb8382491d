#pragma once

#include <chrono>
#include <string>

#include "sandbox/language_registry.hpp"
#include "sandbox/types.hpp"

namespace coderun::sandbox {

// One isolation strategy. Implementations are shared by all worker threads,
// so Run must not touch mutable shared state.
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;
    virtual std::string Name() const = 0;
    // Whether this backend can run executions on this host.
    virtual bool Probe() = 0;
    virtual RawOutcome Run(const std::string& code,
                           const LanguageSpec& spec,
                           const std::string& stdin_data,
                           std::chrono::milliseconds timeout) = 0;
};

}  // namespace coderun::sandbox
