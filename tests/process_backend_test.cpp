#include <gtest/gtest.h>

#include <filesystem>

#include "config/config_schema.hpp"
#include "sandbox/process_backend.hpp"
#include "test_support.hpp"

using coderun::config::SandboxConfig;
using coderun::sandbox::LanguageSpec;
using coderun::sandbox::ProcessBackend;
using coderun::testing::HaveProgram;
using coderun::testing::ScopedEnv;
using coderun::testing::TempDir;

namespace {

LanguageSpec Bash() {
    LanguageSpec spec{};
    spec.id = "bash";
    spec.command = {"bash"};
    spec.extension = ".sh";
    spec.timeout = std::chrono::seconds(15);
    spec.memory_limit_bytes = 64ull * 1024 * 1024;
    return spec;
}

LanguageSpec Python() {
    LanguageSpec spec{};
    spec.id = "python";
    spec.command = {"python3"};
    spec.extension = ".py";
    spec.timeout = std::chrono::seconds(30);
    spec.memory_limit_bytes = 128ull * 1024 * 1024;
    return spec;
}

class ProcessBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HaveProgram("bash")) {
            GTEST_SKIP() << "bash not installed";
        }
        settings_.scratch_root = root_.Path().string();
    }

    TempDir root_;
    SandboxConfig settings_;
};

}  // namespace

TEST_F(ProcessBackendTest, RunsScriptAndCleansUp) {
    ProcessBackend backend(settings_);
    EXPECT_TRUE(backend.Probe());
    const auto outcome = backend.Run("echo hello\n", Bash(), "", std::chrono::seconds(5));
    ASSERT_TRUE(outcome.launch_error.empty()) << outcome.launch_error;
    EXPECT_EQ(outcome.stdout_text, "hello\n");
    EXPECT_EQ(outcome.exit_code.value_or(-1), 0);
    EXPECT_TRUE(std::filesystem::is_empty(root_.Path()));
}

TEST_F(ProcessBackendTest, ProbeFollowsFallbackSetting) {
    settings_.process_fallback = false;
    ProcessBackend backend(settings_);
    EXPECT_FALSE(backend.Probe());
}

TEST_F(ProcessBackendTest, ReadsStdin) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("read name; echo \"hi $name\"", Bash(), "world\n", std::chrono::seconds(5));
    EXPECT_EQ(outcome.stdout_text, "hi world\n");
}

TEST_F(ProcessBackendTest, ReportsNonZeroExit) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("echo partial; echo oops >&2; exit 4", Bash(), "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.exit_code.value_or(-1), 4);
    EXPECT_EQ(outcome.stdout_text, "partial\n");
    EXPECT_EQ(outcome.stderr_text, "oops\n");
    EXPECT_FALSE(outcome.resource_exceeded);
}

TEST_F(ProcessBackendTest, InfiniteLoopTimesOut) {
    ProcessBackend backend(settings_);
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = backend.Run("while true; do :; done", Bash(), "", std::chrono::milliseconds(500));
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    EXPECT_TRUE(std::filesystem::is_empty(root_.Path()));
}

TEST_F(ProcessBackendTest, DoesNotLeakHostEnvironment) {
    ScopedEnv proxy("HTTP_PROXY", "http://proxy.internal:3128");
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("echo \"${HTTP_PROXY:-none}\"", Bash(), "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.stdout_text, "none\n");
}

TEST_F(ProcessBackendTest, WorkingDirectoryIsScratch) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("pwd; ls", Bash(), "", std::chrono::seconds(5));
    const auto root = std::filesystem::canonical(root_.Path()).string();
    EXPECT_EQ(outcome.stdout_text.rfind(root, 0), 0u) << outcome.stdout_text;
    EXPECT_NE(outcome.stdout_text.find("main.sh"), std::string::npos);
}

TEST_F(ProcessBackendTest, MissingInterpreterIsALaunchError) {
    ProcessBackend backend(settings_);
    auto spec = Bash();
    spec.command = {"coderun-no-such-interpreter"};
    const auto outcome = backend.Run("echo hi", spec, "", std::chrono::seconds(5));
    EXPECT_FALSE(outcome.launch_error.empty());
}

TEST_F(ProcessBackendTest, PythonHelloWorld) {
    if (!HaveProgram("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("print('Hello, World!')", Python(), "", std::chrono::seconds(10));
    EXPECT_EQ(outcome.stdout_text, "Hello, World!\n");
    EXPECT_EQ(outcome.exit_code.value_or(-1), 0);
}

TEST_F(ProcessBackendTest, PythonOverMemoryCeilingIsResourceExceeded) {
    if (!HaveProgram("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("data = bytearray(1024 * 1024 * 1024)\nprint(len(data))",
                                     Python(), "", std::chrono::seconds(10));
    EXPECT_TRUE(outcome.resource_exceeded) << outcome.stderr_text;
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_TRUE(outcome.stdout_text.empty());
}

TEST_F(ProcessBackendTest, PrintedMemoryWordsAreNotResourceExhaustion) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("echo 'warning: out of memory' >&2; echo bye >&2; exit 1",
                                     Bash(), "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.exit_code.value_or(-1), 1);
    EXPECT_FALSE(outcome.resource_exceeded);
}

TEST_F(ProcessBackendTest, AllocatorFailureOnLastLineIsResourceExhaustion) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("echo 'bash: xmalloc: cannot allocate 1048576 bytes' >&2; exit 2",
                                     Bash(), "", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.resource_exceeded);
}

TEST_F(ProcessBackendTest, CapsProcessCount) {
    settings_.max_processes = 64;
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("ulimit -u", Bash(), "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.stdout_text, "64\n");
}

TEST_F(ProcessBackendTest, ScratchIsPrivate) {
    ProcessBackend backend(settings_);
    const auto outcome = backend.Run("stat -c %a . main.sh", Bash(), "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.stdout_text, "700\n600\n");
}
