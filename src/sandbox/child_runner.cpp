#include "sandbox/child_runner.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <system_error>
#include <thread>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/process.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/extend.hpp>

#include <errno.h>
#include <fcntl.h>
#include <pthread.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace bp = boost::process;
namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollInterval = std::chrono::milliseconds(20);
// How long pipes may stay open after the supervisor is gone.
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
// How long the supervisor gets to clean up after a stop request.
constexpr auto kStopGrace = std::chrono::seconds(1);

constexpr const char* kTag = "sandbox";

// Exit status of a child whose setup failed before exec.
constexpr int kSetupFailedStatus = 127;

// Upper bound for the descriptor sweep when close_range is unavailable.
constexpr int kMaxSweptDescriptor = 65536;

// Everything below up to RunChild's supervision loop runs in forked
// children of a possibly multi-threaded process: async-signal-safe calls
// only, no allocation.

volatile std::sig_atomic_t g_stop_requested = 0;

void OnStopRequest(int) {
    g_stop_requested = 1;
}

// Plain values only: read in the forked child before exec.
struct ExecSetup {
    bool apply_limits = false;
    ResourceLimits limits;
    bool isolate_network = false;
};

bool SetLimit(int resource, std::uint64_t value) {
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    return ::setrlimit(resource, &rl) == 0;
}

int DescriptorSweepLimit() {
    struct rlimit rl;
    if (::getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY) {
        return kMaxSweptDescriptor;
    }
    return static_cast<int>(std::min<rlim_t>(rl.rlim_cur, kMaxSweptDescriptor));
}

// Descriptors other threads created without O_CLOEXEC (pipes of concurrent
// runs, sockets) must not reach the program.
void MarkDescriptorsCloseOnExec(int from) {
    if (::close_range(static_cast<unsigned>(from), ~0U, CLOSE_RANGE_CLOEXEC) == 0) {
        return;
    }
    const int limit = DescriptorSweepLimit();
    for (int fd = from; fd < limit; ++fd) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0 && (flags & FD_CLOEXEC) == 0) {
            ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }
    }
}

void CloseDescriptors(int from) {
    if (::close_range(static_cast<unsigned>(from), ~0U, 0) == 0) {
        return;
    }
    const int limit = DescriptorSweepLimit();
    for (int fd = from; fd < limit; ++fd) {
        ::close(fd);
    }
}

void ResetSignalState() {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig == SIGKILL || sig == SIGSTOP) {
            continue;
        }
        // Signals reserved by the C library reject SIG_DFL; nothing to reset.
        ::sigaction(sig, &action, nullptr);
    }
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
}

void SleepBriefly() {
    struct timespec delay {};
    delay.tv_nsec = 5 * 1000 * 1000;
    ::nanosleep(&delay, nullptr);
}

// "/proc/self/task/<pid>/children" of the calling (single-threaded) process.
void ChildrenListPath(char* buffer, std::size_t size) {
    static constexpr char kPrefix[] = "/proc/self/task/";
    static constexpr char kSuffix[] = "/children";
    char digits[16];
    int count = 0;
    for (pid_t value = ::getpid(); value > 0 && count < 16; value /= 10) {
        digits[count++] = static_cast<char>('0' + value % 10);
    }
    std::size_t pos = 0;
    for (const char* p = kPrefix; *p != '\0' && pos + 1 < size; ++p) {
        buffer[pos++] = *p;
    }
    while (count > 0 && pos + 1 < size) {
        buffer[pos++] = digits[--count];
    }
    for (const char* p = kSuffix; *p != '\0' && pos + 1 < size; ++p) {
        buffer[pos++] = *p;
    }
    buffer[pos] = '\0';
}

void KillProcessAndGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

// Kills every direct child of the supervisor. As a subreaper it inherits
// every orphan of the program's tree, whatever session it moved to.
void KillAdoptedChildren() {
    char path[64];
    ChildrenListPath(path, sizeof(path));
    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    char buffer[512];
    pid_t pid = 0;
    bool in_number = false;
    for (;;) {
        const ssize_t size = ::read(fd, buffer, sizeof(buffer));
        if (size < 0 && errno == EINTR) {
            continue;
        }
        if (size <= 0) {
            break;
        }
        for (ssize_t i = 0; i < size; ++i) {
            const char c = buffer[i];
            if (c >= '0' && c <= '9') {
                pid = pid * 10 + (c - '0');
                in_number = true;
            } else {
                if (in_number) {
                    KillProcessAndGroup(pid);
                }
                pid = 0;
                in_number = false;
            }
        }
    }
    if (in_number) {
        KillProcessAndGroup(pid);
    }
    ::close(fd);
}

[[noreturn]] void ExitLike(int status) {
    if (WIFEXITED(status)) {
        ::_exit(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        struct sigaction action {};
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        ::sigaction(sig, &action, nullptr);
        SetLimit(RLIMIT_CORE, 0);
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, sig);
        ::sigprocmask(SIG_UNBLOCK, &set, nullptr);
        ::kill(::getpid(), sig);
    }
    ::_exit(kSetupFailedStatus);
}

// Body of the supervisor: waits for the program, then kills and reaps every
// remaining descendant and exits the way the program did. A SIGTERM from the
// broker turns into SIGKILL for the whole tree.
[[noreturn]] void SuperviseProgram(pid_t program) {
    // Only the program's tree may hold the stdio pipes and the launch
    // error pipe.
    CloseDescriptors(0);

    int program_status = kSetupFailedStatus << 8;
    bool program_done = false;
    while (!program_done) {
        if (g_stop_requested) {
            KillProcessAndGroup(program);
            KillAdoptedChildren();
        }
        int status = 0;
        const pid_t reaped = ::waitpid(-1, &status, WNOHANG);
        if (reaped == program) {
            program_status = status;
            program_done = true;
        } else if (reaped == 0 || (reaped < 0 && errno == EINTR)) {
            SleepBriefly();
        } else if (reaped < 0) {
            break;
        }
    }

    for (;;) {
        ::kill(-program, SIGKILL);
        KillAdoptedChildren();
        int status = 0;
        const pid_t reaped = ::waitpid(-1, &status, WNOHANG);
        if (reaped < 0 && errno == ECHILD) {
            break;
        }
        if (reaped <= 0) {
            SleepBriefly();
        }
    }
    ExitLike(program_status);
}

template <typename Executor>
[[noreturn]] void FailSetup(Executor& exec, const char* message) {
    exec.set_error(std::error_code(errno, std::system_category()), message);
    ::_exit(kSetupFailedStatus);
}

// Runs in the forked child after the stdio redirections. The child becomes
// the supervisor and forks again; only the grandchild returns here and goes
// on to exec the program.
template <typename Executor>
void ApplyExecSetup(const ExecSetup& setup, Executor& exec) {
    struct sigaction stop {};
    stop.sa_handler = OnStopRequest;
    sigemptyset(&stop.sa_mask);
    ::sigaction(SIGTERM, &stop, nullptr);
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (::setpgid(0, 0) != 0) {
        FailSetup(exec, "setpgid failed");
    }
    MarkDescriptorsCloseOnExec(3);
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) {
        FailSetup(exec, "prctl(PR_SET_CHILD_SUBREAPER) failed");
    }
    const pid_t program = ::fork();
    if (program < 0) {
        FailSetup(exec, "fork failed");
    }
    if (program > 0) {
        SuperviseProgram(program);
    }

    ResetSignalState();
    if (::setpgid(0, 0) != 0) {
        FailSetup(exec, "setpgid failed");
    }
    if (setup.isolate_network && ::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
        FailSetup(exec, "network namespace unavailable");
    }
    if (!setup.apply_limits) {
        return;
    }
    const auto& limits = setup.limits;
    if (limits.data_bytes > 0 && !SetLimit(RLIMIT_DATA, limits.data_bytes)) {
        FailSetup(exec, "setrlimit(RLIMIT_DATA) failed");
    }
    if (limits.cpu_seconds > 0) {
        struct rlimit rl;
        rl.rlim_cur = static_cast<rlim_t>(limits.cpu_seconds);
        rl.rlim_max = static_cast<rlim_t>(limits.cpu_seconds + 1);
        if (::setrlimit(RLIMIT_CPU, &rl) != 0) {
            FailSetup(exec, "setrlimit(RLIMIT_CPU) failed");
        }
    }
    if (limits.file_bytes > 0 && !SetLimit(RLIMIT_FSIZE, limits.file_bytes)) {
        FailSetup(exec, "setrlimit(RLIMIT_FSIZE) failed");
    }
    if (limits.max_processes > 0 && !SetLimit(RLIMIT_NPROC, limits.max_processes)) {
        FailSetup(exec, "setrlimit(RLIMIT_NPROC) failed");
    }
    if (limits.disable_core_dumps && !SetLimit(RLIMIT_CORE, 0)) {
        FailSetup(exec, "setrlimit(RLIMIT_CORE) failed");
    }
}

// Blocks SIGPIPE on the calling thread so that feeding a child which closed
// its stdin fails with EPIPE. SIGPIPE raised meanwhile is discarded before
// the previous mask is restored.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        if (::sigpending(&pending) == 0) {
            was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        }
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &previous_) == 0;
    }

    ~ScopedSigpipeBlock() {
        if (!blocked_) {
            return;
        }
        if (!was_pending_) {
            const struct timespec zero {};
            while (::sigtimedwait(&pipe_set_, nullptr, &zero) == SIGPIPE) {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t previous_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

// A launch that failed after fork still leaves a child to collect.
void ReapFailedLaunch(pid_t pid) {
    if (pid <= 0) {
        return;
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

struct StreamCapture {
    explicit StreamCapture(boost::asio::io_context& io) : pipe(io) {}

    bp::async_pipe pipe;
    std::array<char, 4096> buffer{};
    std::string text;
    bool truncated = false;
    bool open = true;
};

class ChildSession {
public:
    ChildSession(boost::asio::io_context& io, const ChildSpec& spec)
        : io_(io)
        , spec_(spec)
        , stdin_pipe_(io)
        , stdout_(io)
        , stderr_(io)
        , poll_timer_(io) {}
    ~ChildSession();

    RawOutcome Run(const boost::filesystem::path& exe);

private:
    boost::asio::io_context& io_;
    const ChildSpec& spec_;
    bp::async_pipe stdin_pipe_;
    StreamCapture stdout_;
    StreamCapture stderr_;
    boost::asio::steady_timer poll_timer_;
    bp::child child_;
    pid_t pid_ = -1;
    Clock::time_point deadline_{};
    Clock::time_point exited_at_{};
    Clock::time_point stop_sent_at_{};
    bool exited_ = false;
    bool stop_sent_ = false;
    bool force_killed_ = false;
    bool timed_out_ = false;

    void StartRead(StreamCapture& stream);
    void Append(StreamCapture& stream, std::size_t size);
    void WriteStdin();
    void CloseStdin();
    void CloseStreams();
    bool StreamsOpen() const { return stdout_.open || stderr_.open; }
    void SchedulePoll();
    void Poll();
    void RequestStop();
    void KillGroup();
};

ChildSession::~ChildSession() {
    if (pid_ <= 0 || exited_) {
        return;
    }
    // Give the supervisor the chance to take the whole tree down with it.
    RequestStop();
    std::error_code ec;
    const auto give_up = Clock::now() + kStopGrace;
    while (child_.running(ec) && Clock::now() < give_up) {
        std::this_thread::sleep_for(kPollInterval);
    }
    if (child_.running(ec)) {
        KillGroup();
    }
    child_.wait(ec);
}

RawOutcome ChildSession::Run(const boost::filesystem::path& exe) {
    RawOutcome outcome{};

    bp::environment env;
    if (spec_.inherit_environment) {
        const auto native = boost::this_process::environment();
        for (const auto& entry : native) {
            env[entry.get_name()] = entry.to_string();
        }
    }
    for (const auto& [key, value] : spec_.env) {
        env[key] = value;
    }

    ExecSetup setup{};
    setup.apply_limits = spec_.apply_limits;
    setup.limits = spec_.limits;
    setup.isolate_network = spec_.isolate_network;

    const auto working_dir = spec_.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec_.working_dir.string();

    const auto started = Clock::now();
    deadline_ = started + spec_.timeout;
    std::error_code launch_ec;
    pid_t failed_pid = -1;
    child_ = bp::child(
        exe,
        bp::args(spec_.args),
        env,
        bp::start_dir = working_dir,
        bp::std_in < stdin_pipe_,
        bp::std_out > stdout_.pipe,
        bp::std_err > stderr_.pipe,
        launch_ec,
        bp::extend::on_exec_setup = [setup](auto& exec) { ApplyExecSetup(setup, exec); },
        bp::extend::on_error = [&failed_pid](auto& exec, const std::error_code&) { failed_pid = exec.pid; });
    if (launch_ec) {
        ReapFailedLaunch(failed_pid);
        outcome.launch_error = "exec failed: " + launch_ec.message();
        return outcome;
    }
    pid_ = child_.id();
    utils::LogDebug(kTag, "spawned supervisor pid=" + std::to_string(pid_) + " program=" + spec_.program);

    StartRead(stdout_);
    StartRead(stderr_);
    WriteStdin();
    SchedulePoll();
    io_.run();

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        (exited_ ? exited_at_ : Clock::now()) - started);
    outcome.timed_out = timed_out_;
    outcome.stdout_text = std::move(stdout_.text);
    outcome.stderr_text = std::move(stderr_.text);
    outcome.stdout_truncated = stdout_.truncated;
    outcome.stderr_truncated = stderr_.truncated;

    const int status = child_.native_exit_code();
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }
    return outcome;
}

void ChildSession::StartRead(StreamCapture& stream) {
    stream.pipe.async_read_some(
        boost::asio::buffer(stream.buffer),
        [this, &stream](const boost::system::error_code& ec, std::size_t size) {
            if (size > 0) {
                Append(stream, size);
            }
            if (ec) {
                stream.open = false;
                boost::system::error_code ignored;
                stream.pipe.close(ignored);
                return;
            }
            StartRead(stream);
        });
}

void ChildSession::Append(StreamCapture& stream, std::size_t size) {
    const auto limit = spec_.max_output_bytes;
    const std::size_t avail = stream.text.size() < limit ? limit - stream.text.size() : 0;
    const std::size_t take = std::min(size, avail);
    stream.text.append(stream.buffer.data(), take);
    if (take < size) {
        stream.truncated = true;
    }
}

void ChildSession::WriteStdin() {
    if (spec_.stdin_data.empty()) {
        CloseStdin();
        return;
    }
    boost::asio::async_write(
        stdin_pipe_,
        boost::asio::buffer(spec_.stdin_data),
        [this](const boost::system::error_code& ec, std::size_t) {
            if (ec && ec != boost::asio::error::operation_aborted) {
                utils::LogDebug(kTag, "stdin not fully consumed: " + ec.message());
            }
            CloseStdin();
        });
}

void ChildSession::CloseStdin() {
    boost::system::error_code ec;
    stdin_pipe_.close(ec);
}

void ChildSession::CloseStreams() {
    boost::system::error_code ec;
    stdout_.pipe.close(ec);
    stderr_.pipe.close(ec);
    CloseStdin();
}

void ChildSession::SchedulePoll() {
    poll_timer_.expires_after(kPollInterval);
    poll_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            Poll();
        }
    });
}

void ChildSession::Poll() {
    const auto now = Clock::now();
    if (!exited_) {
        std::error_code ec;
        const bool running = child_.running(ec);
        if (ec) {
            utils::LogWarn(kTag, "waitpid failed for pid=" + std::to_string(pid_) + ": " + ec.message());
        }
        if (!running) {
            exited_ = true;
            exited_at_ = now;
        } else if (!stop_sent_ && now >= deadline_) {
            utils::LogInfo(kTag, "deadline reached, stopping supervisor " + std::to_string(pid_));
            timed_out_ = true;
            RequestStop();
        } else if (stop_sent_ && !force_killed_ && now - stop_sent_at_ >= kStopGrace) {
            utils::LogWarn(kTag, "supervisor " + std::to_string(pid_) + " ignored stop request, killing it");
            force_killed_ = true;
            KillGroup();
        }
    }

    if (exited_) {
        if (StreamsOpen() && now - exited_at_ >= kDrainGrace) {
            utils::LogWarn(kTag, "output pipes still held after exit of pid=" + std::to_string(pid_));
            CloseStreams();
        }
        if (!StreamsOpen()) {
            CloseStdin();
            return;
        }
    }
    SchedulePoll();
}

void ChildSession::RequestStop() {
    stop_sent_ = true;
    stop_sent_at_ = Clock::now();
    if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        utils::LogWarn(kTag, "kill(" + std::to_string(pid_) + ") failed: " + std::error_code(errno, std::system_category()).message());
    }
}

void ChildSession::KillGroup() {
    if (pid_ <= 0) {
        return;
    }
    if (::kill(-pid_, SIGKILL) != 0 && errno != ESRCH) {
        utils::LogWarn(kTag, "kill(-" + std::to_string(pid_) + ") failed: " + std::error_code(errno, std::system_category()).message());
    }
}

boost::filesystem::path ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return boost::filesystem::path(program);
    }
    return bp::search_path(program);
}

}  // namespace

RawOutcome RunChild(const ChildSpec& spec) {
    const auto exe = ResolveProgram(spec.program);
    if (exe.empty()) {
        RawOutcome outcome{};
        outcome.launch_error = "executable not found: " + spec.program;
        return outcome;
    }

    ScopedSigpipeBlock sigpipe_block;
    try {
        boost::asio::io_context io;
        ChildSession session(io, spec);
        return session.Run(exe);
    } catch (const std::exception& ex) {
        RawOutcome outcome{};
        outcome.launch_error = std::string("supervision failed: ") + ex.what();
        utils::LogError(kTag, outcome.launch_error);
        return outcome;
    }
}

}  // namespace coderun::sandbox
