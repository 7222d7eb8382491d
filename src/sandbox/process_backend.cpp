#include "sandbox/process_backend.hpp"

#include <csignal>
#include <filesystem>
#include <memory>
#include <vector>

#include "sandbox/child_runner.hpp"
#include "sandbox/scratch_workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace {

constexpr const char* kTag = "process";

constexpr const char* kSafePath = "/usr/local/bin:/usr/bin:/bin";

// Last line of an interpreter that died on a failed allocation.
const std::vector<std::string> kOutOfMemoryLastLine = {
    "cannot allocate memory",
    "xmalloc: cannot allocate",
    "std::bad_alloc"
};

// V8 aborts with these anywhere in its fatal error report.
const std::vector<std::string> kOutOfMemoryReport = {
    "javascript heap out of memory",
    "fatal process out of memory"
};

std::string LastNonEmptyLine(const std::string& text) {
    std::size_t end = text.size();
    while (end > 0) {
        const auto start = text.rfind('\n', end - 1);
        const auto begin = start == std::string::npos ? 0 : start + 1;
        const auto line = utils::Trim(text.substr(begin, end - begin));
        if (!line.empty()) {
            return line;
        }
        if (start == std::string::npos) {
            break;
        }
        end = start;
    }
    return {};
}

// Looks only at what an allocator failure leaves behind, so a program that
// merely prints "out of memory" somewhere is not reported as one.
bool LooksOutOfMemory(const std::string& stderr_text) {
    const auto lowered = utils::ToLower(stderr_text);
    for (const auto& marker : kOutOfMemoryReport) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    const auto last = LastNonEmptyLine(lowered);
    if (last.rfind("memoryerror", 0) == 0) {
        return true;
    }
    for (const auto& marker : kOutOfMemoryLastLine) {
        if (last.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void Classify(RawOutcome& outcome) {
    if (outcome.term_signal) {
        if (*outcome.term_signal == SIGXCPU) {
            outcome.timed_out = true;
        } else if (*outcome.term_signal == SIGXFSZ) {
            outcome.resource_exceeded = true;
        }
    }
    if (!outcome.timed_out && outcome.exit_code.value_or(0) != 0 && LooksOutOfMemory(outcome.stderr_text)) {
        outcome.resource_exceeded = true;
    }
}

}  // namespace

ProcessBackend::ProcessBackend(const config::SandboxConfig& settings)
    : settings_(settings) {}

bool ProcessBackend::Probe() {
    return settings_.process_fallback;
}

RawOutcome ProcessBackend::Run(const std::string& code,
                               const LanguageSpec& spec,
                               const std::string& stdin_data,
                               std::chrono::milliseconds timeout) {
    RawOutcome outcome{};
    if (spec.command.empty()) {
        outcome.launch_error = "no interpreter configured for " + spec.id;
        return outcome;
    }

    std::unique_ptr<ScratchWorkspace> workspace;
    try {
        workspace = std::make_unique<ScratchWorkspace>(
            ScratchWorkspace::ResolveRoot(settings_.scratch_root),
            spec.extension,
            code,
            ScratchWorkspace::Access::kPrivate);
    } catch (const std::filesystem::filesystem_error& ex) {
        outcome.launch_error = std::string("cannot prepare scratch directory: ") + ex.what();
        return outcome;
    }

    ChildSpec child{};
    child.program = spec.command.front();
    child.args.assign(spec.command.begin() + 1, spec.command.end());
    child.args.push_back(workspace->SourceFile().string());
    child.env = {
        {"PATH", kSafePath},
        {"HOME", workspace->Directory().string()},
        {"TMPDIR", workspace->Directory().string()},
        {"LANG", "C.UTF-8"},
        {"PYTHONDONTWRITEBYTECODE", "1"}
    };
    child.inherit_environment = false;
    child.working_dir = workspace->Directory();
    child.stdin_data = stdin_data;
    child.timeout = timeout;
    child.max_output_bytes = settings_.max_output_bytes;
    child.apply_limits = true;
    child.limits.data_bytes = spec.memory_limit_bytes;
    child.limits.cpu_seconds = static_cast<std::uint64_t>(
        std::chrono::ceil<std::chrono::seconds>(timeout).count()) + 1;
    child.limits.file_bytes = settings_.max_file_bytes;
    child.limits.max_processes = settings_.max_processes;
    child.isolate_network = settings_.process_network_namespace && spec.network_disabled;

    utils::LogDebug(kTag, "run language=" + spec.id + " dir=" + workspace->Directory().string());
    outcome = RunChild(child);
    Classify(outcome);
    return outcome;
}

}  // namespace coderun::sandbox
