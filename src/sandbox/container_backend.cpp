#include "sandbox/container_backend.hpp"

#include <memory>
#include <sstream>

#include "sandbox/child_runner.hpp"
#include "sandbox/scratch_workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace {

constexpr const char* kTag = "container";

constexpr const char* kMountPoint = "/code";

// docker run exit statuses that describe the runtime, not the program.
constexpr int kDockerRunError = 125;
constexpr int kKilledStatus = 137;

constexpr auto kRemoveTimeout = std::chrono::seconds(15);

void RemoveContainer(const std::string& docker_binary, const std::string& name) {
    ChildSpec spec{};
    spec.program = docker_binary;
    spec.args = {"rm", "-f", "-v", name};
    spec.inherit_environment = true;
    spec.timeout = kRemoveTimeout;
    spec.max_output_bytes = 4096;
    const auto outcome = RunChild(spec);
    if (!outcome.launch_error.empty()) {
        utils::LogWarn(kTag, "rm " + name + " failed: " + outcome.launch_error);
    } else if (outcome.exit_code.value_or(-1) != 0) {
        // "No such container" when the client died before the daemon created it.
        utils::LogDebug(kTag, "rm " + name + ": " + utils::Trim(outcome.stderr_text));
    } else {
        utils::LogDebug(kTag, "removed " + name);
    }
}

// Force-removes the named container unless dismissed, whatever way Run exits.
class ContainerGuard {
public:
    ContainerGuard(std::string docker_binary, std::string name)
        : docker_binary_(std::move(docker_binary))
        , name_(std::move(name)) {}

    ~ContainerGuard() {
        if (dismissed_) {
            return;
        }
        try {
            RemoveContainer(docker_binary_, name_);
        } catch (const std::exception& ex) {
            utils::LogError(kTag, "cleanup of " + name_ + " failed: " + ex.what());
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    void Dismiss() { dismissed_ = true; }

private:
    std::string docker_binary_;
    std::string name_;
    bool dismissed_ = false;
};

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

}  // namespace

ContainerBackend::ContainerBackend(const config::ContainerConfig& container,
                                   const config::SandboxConfig& sandbox)
    : container_(container)
    , sandbox_(sandbox) {}

bool ContainerBackend::Probe() {
    if (!sandbox_.use_containers) {
        return false;
    }
    ChildSpec spec{};
    spec.program = container_.docker_binary;
    spec.args = {"version", "--format", "{{.Server.Version}}"};
    spec.inherit_environment = true;
    spec.timeout = std::chrono::seconds(container_.probe_timeout_s);
    spec.max_output_bytes = 4096;
    const auto outcome = RunChild(spec);
    if (!outcome.launch_error.empty()) {
        utils::LogInfo(kTag, "runtime unavailable: " + outcome.launch_error);
        return false;
    }
    if (outcome.timed_out || outcome.exit_code.value_or(-1) != 0) {
        utils::LogInfo(kTag, "runtime unreachable: " + utils::Trim(outcome.stderr_text));
        return false;
    }
    utils::LogInfo(kTag, "runtime reachable, server " + utils::Trim(outcome.stdout_text));
    return true;
}

std::vector<std::string> ContainerBackend::BuildRunArguments(const std::string& container_name,
                                                             const LanguageSpec& spec,
                                                             const std::filesystem::path& code_dir,
                                                             const std::string& file_name,
                                                             std::chrono::milliseconds timeout) const {
    const auto memory = std::to_string(spec.MemoryLimitMb()) + "m";
    std::vector<std::string> args = {
        "run", "--rm", "-i",
        "--name", container_name
    };
    if (spec.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    args.insert(args.end(), {
        "--memory", memory,
        "--memory-swap", memory,
        "--cpus", FormatCpus(container_.cpus),
        "--pids-limit", std::to_string(container_.pids_limit),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=" + std::to_string(container_.tmpfs_size_mb) + "m",
        "-e", "HOME=/tmp"
    });
    if (!container_.user.empty()) {
        args.insert(args.end(), {"--user", container_.user});
    }
    if (!container_.pull_policy.empty()) {
        args.insert(args.end(), {"--pull", container_.pull_policy, "--quiet"});
    }
    args.insert(args.end(), {
        "-v", code_dir.string() + ":" + kMountPoint + ":ro",
        "-w", kMountPoint,
        spec.image
    });
    if (container_.inner_timeout) {
        // Bounds the container even if the daemon starts it after we gave up.
        const auto seconds = std::chrono::ceil<std::chrono::seconds>(timeout).count() + 1;
        args.insert(args.end(), {"timeout", "-s", "KILL", std::to_string(seconds)});
    }
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    args.push_back(std::string(kMountPoint) + "/" + file_name);
    return args;
}

RawOutcome ContainerBackend::Run(const std::string& code,
                                 const LanguageSpec& spec,
                                 const std::string& stdin_data,
                                 std::chrono::milliseconds timeout) {
    RawOutcome outcome{};
    if (spec.command.empty() || spec.image.empty()) {
        outcome.launch_error = "no image or command configured for " + spec.id;
        return outcome;
    }

    std::unique_ptr<ScratchWorkspace> workspace;
    try {
        workspace = std::make_unique<ScratchWorkspace>(
            ScratchWorkspace::ResolveRoot(sandbox_.scratch_root),
            spec.extension,
            code,
            ScratchWorkspace::Access::kShared);
    } catch (const std::filesystem::filesystem_error& ex) {
        outcome.launch_error = std::string("cannot prepare scratch directory: ") + ex.what();
        return outcome;
    }

    const auto name = utils::MakeUniqueToken("coderun-");
    ChildSpec child{};
    child.program = container_.docker_binary;
    child.args = BuildRunArguments(name, spec, workspace->Directory(), workspace->SourceFileName(), timeout);
    child.inherit_environment = true;
    child.working_dir = workspace->Directory();
    child.stdin_data = stdin_data;
    child.timeout = timeout;
    child.max_output_bytes = sandbox_.max_output_bytes;

    utils::LogDebug(kTag, "run language=" + spec.id + " image=" + spec.image + " name=" + name);
    // Declared after the workspace so the container goes before its mount.
    ContainerGuard guard(container_.docker_binary, name);
    outcome = RunChild(child);
    if (!outcome.launch_error.empty()) {
        return outcome;
    }

    if (!outcome.timed_out && outcome.exit_code) {
        // The client saw the container exit; --rm has removed it.
        guard.Dismiss();
        if (*outcome.exit_code == kDockerRunError) {
            outcome.launch_error = "container runtime error: " + utils::Trim(outcome.stderr_text);
        } else if (*outcome.exit_code == kKilledStatus) {
            outcome.resource_exceeded = true;
        }
    }
    return outcome;
}

}  // namespace coderun::sandbox
