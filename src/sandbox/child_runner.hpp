#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "sandbox/types.hpp"

namespace coderun::sandbox {

// Applied in the child between fork and exec. Zero means "leave as is".
struct ResourceLimits {
    std::uint64_t data_bytes = 0;
    std::uint64_t cpu_seconds = 0;
    std::uint64_t file_bytes = 0;
    // RLIMIT_NPROC; counts every process of the user, not only this run.
    std::uint64_t max_processes = 0;
    bool disable_core_dumps = true;
};

struct ChildSpec {
    // Looked up on PATH unless it contains a '/'.
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool inherit_environment = false;
    std::filesystem::path working_dir;
    std::string stdin_data;
    std::chrono::milliseconds timeout{30000};
    std::size_t max_output_bytes = 64 * 1024;
    bool apply_limits = false;
    ResourceLimits limits;
    bool isolate_network = false;
};

// Runs one program under a small supervisor process and watches it:
// stdin is fed, stdout/stderr are captured up to max_output_bytes each and
// drained beyond that, and once the deadline passes the supervisor is told
// to kill everything it started. The supervisor is a child subreaper, so
// descendants that leave the program's process group or session are still
// killed and reaped before it exits; on return nothing the program started
// is alive. The supervisor mirrors the program's exit status.
//
// SIGPIPE is blocked on the calling thread for the duration of the call
// and any SIGPIPE raised by feeding stdin is discarded; process-wide
// signal dispositions are left alone. The program starts with default
// dispositions and an empty signal mask.
//
// Never throws; launch failures are reported through
// RawOutcome::launch_error.
RawOutcome RunChild(const ChildSpec& spec);

}  // namespace coderun::sandbox
