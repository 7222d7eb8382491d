#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_backend.hpp"

namespace coderun::sandbox {

// Runs each execution in a fresh single-use container through the docker
// CLI: no network, memory/cpu/pids ceilings, read-only root, all
// capabilities dropped, the source directory mounted read-only at /code.
// The container is force-removed whenever it may have outlived the call.
class ContainerBackend : public ExecutionBackend {
public:
    ContainerBackend(const config::ContainerConfig& container,
                     const config::SandboxConfig& sandbox);

    std::string Name() const override { return "container"; }
    bool Probe() override;
    RawOutcome Run(const std::string& code,
                   const LanguageSpec& spec,
                   const std::string& stdin_data,
                   std::chrono::milliseconds timeout) override;

    std::vector<std::string> BuildRunArguments(const std::string& container_name,
                                               const LanguageSpec& spec,
                                               const std::filesystem::path& code_dir,
                                               const std::string& file_name,
                                               std::chrono::milliseconds timeout) const;

private:
    const config::ContainerConfig& container_;
    const config::SandboxConfig& sandbox_;
};

}  // namespace coderun::sandbox
