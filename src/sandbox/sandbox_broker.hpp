#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_backend.hpp"
#include "sandbox/language_registry.hpp"
#include "sandbox/security_filter.hpp"
#include "sandbox/types.hpp"

namespace coderun::sandbox {

struct HealthReport {
    std::string status;
    std::string active_backend;
    bool container_available = false;
    std::vector<std::string> languages;
};

// Entry point for callers: validates a request, scans it, runs it on the
// backend chosen at first use and folds the outcome into one
// ExecutionResult. Execute never throws and may be called concurrently.
//
// The config must outlive the broker; it is read, never modified.
class SandboxBroker {
public:
    SandboxBroker(const config::Config& config,
                  std::unique_ptr<ExecutionBackend> container,
                  std::unique_ptr<ExecutionBackend> process);

    ExecutionResult Execute(const ExecutionRequest& request);

    HealthReport Health();
    const std::vector<LanguageSpec>& Languages() const { return registry_.List(); }
    std::map<std::string, std::string> Examples() const;

    // Name of the backend in use: "container", "process" or "none".
    std::string ActiveBackendName();

    const LanguageRegistry& Registry() const { return registry_; }
    const SecurityFilter& Filter() const { return filter_; }

private:
    const config::Config& config_;
    LanguageRegistry registry_;
    SecurityFilter filter_;
    std::unique_ptr<ExecutionBackend> container_;
    std::unique_ptr<ExecutionBackend> process_;
    std::once_flag select_once_;
    ExecutionBackend* active_ = nullptr;
    bool container_available_ = false;

    ExecutionBackend* ActiveBackend();
    void SelectBackend();
    ExecutionResult Aggregate(const RawOutcome& raw,
                              const LanguageSpec& spec,
                              const std::string& backend_name) const;
};

// Container and process backends wired from the config.
std::unique_ptr<SandboxBroker> CreateBroker(const config::Config& config);

}  // namespace coderun::sandbox
