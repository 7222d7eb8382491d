#include "sandbox/sandbox_broker.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include "sandbox/code_examples.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/process_backend.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kTag = "broker";

constexpr const char* kTruncationMarker = "\n[output truncated]";

ExecutionResult Failure(ExecutionResult result, ErrorKind kind, std::string message) {
    result.success = false;
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds;
    return oss.str();
}

void LogResult(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << "language=" << result.language
        << " backend=" << (result.backend.empty() ? "-" : result.backend)
        << " exit=" << (result.exit_code ? std::to_string(*result.exit_code) : std::string("-"))
        << " duration=" << FormatSeconds(result.duration_s)
        << " outcome=" << (result.error_kind ? ToString(*result.error_kind) : "Success");
    utils::LogInfo(kTag, oss.str());
}

}  // namespace

SandboxBroker::SandboxBroker(const config::Config& config,
                             std::unique_ptr<ExecutionBackend> container,
                             std::unique_ptr<ExecutionBackend> process)
    : config_(config)
    , registry_(config)
    , container_(std::move(container))
    , process_(std::move(process)) {}

void SandboxBroker::SelectBackend() {
    if (container_ && container_->Probe()) {
        container_available_ = true;
        active_ = container_.get();
    } else if (process_ && process_->Probe()) {
        active_ = process_.get();
    }
    utils::LogInfo(kTag, std::string("active backend: ") + (active_ ? active_->Name() : "none"));
}

ExecutionBackend* SandboxBroker::ActiveBackend() {
    std::call_once(select_once_, [this]() { SelectBackend(); });
    return active_;
}

std::string SandboxBroker::ActiveBackendName() {
    auto* backend = ActiveBackend();
    return backend ? backend->Name() : "none";
}

ExecutionResult SandboxBroker::Execute(const ExecutionRequest& request) {
    const auto started = Clock::now();
    ExecutionResult result{};
    result.language = utils::ToLower(utils::Trim(request.language));

    if (utils::Trim(request.code).empty()) {
        return Failure(std::move(result), ErrorKind::kValidationError, "code must not be empty");
    }
    if (result.language.empty()) {
        return Failure(std::move(result), ErrorKind::kValidationError, "a language must be specified");
    }
    const auto* spec = registry_.Find(result.language);
    if (!spec) {
        return Failure(std::move(result), ErrorKind::kValidationError,
                       "unsupported language: " + result.language +
                           " (supported: " + utils::Join(registry_.Ids(), ", ") + ")");
    }
    if (request.code.size() > config_.sandbox.max_code_bytes) {
        return Failure(std::move(result), ErrorKind::kValidationError,
                       "code is too long (max " + std::to_string(config_.sandbox.max_code_bytes) + " bytes)");
    }
    if (request.stdin_data.size() > config_.sandbox.max_stdin_bytes) {
        return Failure(std::move(result), ErrorKind::kValidationError,
                       "input is too long (max " + std::to_string(config_.sandbox.max_stdin_bytes) + " bytes)");
    }

    const auto scan = filter_.Scan(request.code, spec->id);
    if (!scan.allowed) {
        utils::LogInfo(kTag, "rejected language=" + spec->id + " category=" +
                                 ToString(scan.category) + " pattern=" + scan.pattern);
        return Failure(std::move(result), ErrorKind::kSecurityViolation, scan.Reason());
    }

    auto* backend = ActiveBackend();
    if (!backend) {
        result = Failure(std::move(result), ErrorKind::kBackendUnavailable,
                         "no isolation backend is available");
        LogResult(result);
        return result;
    }

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(spec->timeout);
    RawOutcome raw{};
    try {
        raw = backend->Run(request.code, *spec, request.stdin_data, timeout);
    } catch (const std::exception& ex) {
        raw = RawOutcome{};
        raw.launch_error = ex.what();
    }
    result = Aggregate(raw, *spec, backend->Name());

    const auto elapsed = Clock::now() - started;
    const auto budget = timeout + std::chrono::milliseconds(config_.sandbox.dispatch_budget_ms);
    if (!raw.timed_out && raw.launch_error.empty() && elapsed > budget) {
        result = Failure(std::move(result), ErrorKind::kTimedOut,
                         "execution exceeded its time budget of " + FormatSeconds(
                             std::chrono::duration<double>(budget).count()) + " seconds");
    }
    LogResult(result);
    return result;
}

ExecutionResult SandboxBroker::Aggregate(const RawOutcome& raw,
                                         const LanguageSpec& spec,
                                         const std::string& backend_name) const {
    ExecutionResult result{};
    result.language = spec.id;
    result.backend = backend_name;
    result.stdout_text = raw.stdout_text;
    result.stderr_text = raw.stderr_text;
    result.stdout_truncated = raw.stdout_truncated;
    result.stderr_truncated = raw.stderr_truncated;
    if (raw.stdout_truncated) {
        result.stdout_text += kTruncationMarker;
    }
    if (raw.stderr_truncated) {
        result.stderr_text += kTruncationMarker;
    }
    result.exit_code = raw.exit_code;
    result.duration_s = std::chrono::duration<double>(raw.duration).count();

    if (!raw.launch_error.empty()) {
        utils::LogWarn(kTag, backend_name + " backend failed to start: " + raw.launch_error);
        return Failure(std::move(result), ErrorKind::kBackendUnavailable,
                       "execution environment unavailable: " + raw.launch_error);
    }
    if (raw.timed_out) {
        result.exit_code.reset();
        return Failure(std::move(result), ErrorKind::kTimedOut,
                       "timeout: the code ran longer than " +
                           std::to_string(spec.timeout.count()) + " seconds");
    }
    if (raw.resource_exceeded) {
        return Failure(std::move(result), ErrorKind::kResourceExceeded,
                       "the code exceeded its resource limits (memory " +
                           std::to_string(spec.MemoryLimitMb()) + " MB)");
    }
    if (raw.exit_code && *raw.exit_code == 0) {
        result.success = true;
        return result;
    }
    if (raw.term_signal) {
        return Failure(std::move(result), ErrorKind::kRuntimeFailure,
                       "terminated by signal " + std::to_string(*raw.term_signal));
    }
    if (raw.exit_code) {
        return Failure(std::move(result), ErrorKind::kRuntimeFailure,
                       "process exited with code " + std::to_string(*raw.exit_code));
    }
    return Failure(std::move(result), ErrorKind::kRuntimeFailure, "exit status unavailable");
}

HealthReport SandboxBroker::Health() {
    HealthReport report{};
    report.active_backend = ActiveBackendName();
    report.container_available = container_available_;
    report.status = active_ ? "healthy" : "degraded";
    report.languages = registry_.Ids();
    return report;
}

std::map<std::string, std::string> SandboxBroker::Examples() const {
    std::map<std::string, std::string> examples;
    for (const auto& [id, code] : BuiltinExamples()) {
        if (registry_.Has(id)) {
            examples.emplace(id, code);
        }
    }
    return examples;
}

std::unique_ptr<SandboxBroker> CreateBroker(const config::Config& config) {
    std::unique_ptr<ExecutionBackend> container;
    if (config.sandbox.use_containers) {
        container = std::make_unique<ContainerBackend>(config.container, config.sandbox);
    }
    std::unique_ptr<ExecutionBackend> process;
    if (config.sandbox.process_fallback) {
        process = std::make_unique<ProcessBackend>(config.sandbox);
    }
    return std::make_unique<SandboxBroker>(config, std::move(container), std::move(process));
}

}  // namespace coderun::sandbox
