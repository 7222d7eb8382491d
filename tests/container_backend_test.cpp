#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_backend.hpp"
#include "test_support.hpp"

using coderun::config::ContainerConfig;
using coderun::config::SandboxConfig;
using coderun::sandbox::ContainerBackend;
using coderun::sandbox::LanguageSpec;
using coderun::testing::HaveProgram;
using coderun::testing::ReadFile;
using coderun::testing::ScopedEnv;
using coderun::testing::TempDir;

namespace {

// Stands in for the docker CLI: records every invocation and behaves
// according to FAKE_DOCKER_MODE.
constexpr const char* kFakeDocker = R"(#!/bin/sh
echo "$*" >> "$FAKE_DOCKER_LOG"
case "$1" in
    version)
        echo "24.0.7"
        exit 0
        ;;
    rm)
        exit 0
        ;;
    run)
        case "${FAKE_DOCKER_MODE:-ok}" in
            sleep) sleep 30 ;;
            perms)
                while [ $# -gt 0 ]; do
                    if [ "$1" = "-v" ]; then
                        stat -c %a "${2%%:*}"
                    fi
                    shift
                done
                ;;
            oom) exit 137 ;;
            daemon)
                echo "docker: Error response from daemon: pull access denied" >&2
                exit 125
                ;;
            *) cat ;;
        esac
        exit 0
        ;;
esac
exit 1
)";

LanguageSpec Python() {
    LanguageSpec spec{};
    spec.id = "python";
    spec.image = "python:3.11-alpine";
    spec.command = {"python3"};
    spec.extension = ".py";
    spec.timeout = std::chrono::seconds(30);
    spec.memory_limit_bytes = 128ull * 1024 * 1024;
    return spec;
}

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

// Value following flag, or empty when the flag is absent.
std::string FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    const auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

class ContainerBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HaveProgram("sh")) {
            GTEST_SKIP() << "sh not installed";
        }
        const auto docker = bin_.Write("docker", kFakeDocker);
        std::filesystem::permissions(docker,
                                     std::filesystem::perms::owner_all |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::group_exec);
        container_.docker_binary = docker.string();
        sandbox_.scratch_root = scratch_.Path().string();
        log_path_ = (bin_.Path() / "calls.log").string();
    }

    std::string Calls() const { return ReadFile(log_path_); }

    TempDir bin_;
    TempDir scratch_;
    ContainerConfig container_;
    SandboxConfig sandbox_;
    std::string log_path_;
};

}  // namespace

TEST_F(ContainerBackendTest, ProbeQueriesDaemonVersion) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ContainerBackend backend(container_, sandbox_);
    EXPECT_TRUE(backend.Probe());
    EXPECT_NE(Calls().find("version --format"), std::string::npos);
}

TEST_F(ContainerBackendTest, ProbeFailsWhenDisabled) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    sandbox_.use_containers = false;
    ContainerBackend backend(container_, sandbox_);
    EXPECT_FALSE(backend.Probe());
    EXPECT_TRUE(Calls().empty());
}

TEST_F(ContainerBackendTest, ProbeFailsWithoutBinary) {
    container_.docker_binary = (bin_.Path() / "no-such-docker").string();
    ContainerBackend backend(container_, sandbox_);
    EXPECT_FALSE(backend.Probe());
}

TEST_F(ContainerBackendTest, RunArgumentsCarryIsolationFlags) {
    ContainerBackend backend(container_, sandbox_);
    const auto args = backend.BuildRunArguments("coderun-x", Python(), "/tmp/work", "main.py",
                                                std::chrono::seconds(30));
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[0], "run");
    EXPECT_TRUE(Contains(args, "--rm"));
    EXPECT_TRUE(Contains(args, "-i"));
    EXPECT_TRUE(Contains(args, "--read-only"));
    EXPECT_EQ(FlagValue(args, "--name"), "coderun-x");
    EXPECT_EQ(FlagValue(args, "--network"), "none");
    EXPECT_EQ(FlagValue(args, "--memory"), "128m");
    EXPECT_EQ(FlagValue(args, "--memory-swap"), "128m");
    EXPECT_EQ(FlagValue(args, "--cpus"), "0.5");
    EXPECT_EQ(FlagValue(args, "--pids-limit"), "64");
    EXPECT_EQ(FlagValue(args, "--cap-drop"), "ALL");
    EXPECT_EQ(FlagValue(args, "--security-opt"), "no-new-privileges");
    EXPECT_EQ(FlagValue(args, "--user"), "65534:65534");
    EXPECT_EQ(FlagValue(args, "-v"), "/tmp/work:/code:ro");
    EXPECT_EQ(FlagValue(args, "-w"), "/code");
    EXPECT_EQ(FlagValue(args, "timeout"), "-s");
    EXPECT_TRUE(Contains(args, "31"));

    // Image, then interpreter, then the mounted source file.
    const auto image = std::find(args.begin(), args.end(), "python:3.11-alpine");
    ASSERT_NE(image, args.end());
    EXPECT_EQ(args.back(), "/code/main.py");
    EXPECT_EQ(*(args.end() - 2), "python3");
}

TEST_F(ContainerBackendTest, NetworkFlagFollowsLanguage) {
    ContainerBackend backend(container_, sandbox_);
    auto spec = Python();
    spec.network_disabled = false;
    const auto args = backend.BuildRunArguments("n", spec, "/tmp/w", "main.py", std::chrono::seconds(5));
    EXPECT_FALSE(Contains(args, "--network"));
}

TEST_F(ContainerBackendTest, OptionalFlagsCanBeTurnedOff) {
    container_.user.clear();
    container_.pull_policy.clear();
    container_.inner_timeout = false;
    ContainerBackend backend(container_, sandbox_);
    const auto args = backend.BuildRunArguments("n", Python(), "/tmp/w", "main.py", std::chrono::seconds(5));
    EXPECT_FALSE(Contains(args, "--user"));
    EXPECT_FALSE(Contains(args, "--pull"));
    EXPECT_FALSE(Contains(args, "timeout"));
    EXPECT_EQ(*(args.end() - 3), "python:3.11-alpine");
}

TEST_F(ContainerBackendTest, CompletedRunLeavesNothingToRemove) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ScopedEnv mode("FAKE_DOCKER_MODE", "ok");
    ContainerBackend backend(container_, sandbox_);
    const auto outcome = backend.Run("print(1)", Python(), "echoed\n", std::chrono::seconds(5));
    ASSERT_TRUE(outcome.launch_error.empty()) << outcome.launch_error;
    EXPECT_EQ(outcome.stdout_text, "echoed\n");
    EXPECT_EQ(outcome.exit_code.value_or(-1), 0);

    const auto calls = Calls();
    EXPECT_NE(calls.find("run --rm -i --name coderun-"), std::string::npos);
    EXPECT_EQ(calls.find("rm -f -v"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_empty(scratch_.Path()));
}

TEST_F(ContainerBackendTest, MountedScratchIsReadableByOtherUsers) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ScopedEnv mode("FAKE_DOCKER_MODE", "perms");
    ContainerBackend backend(container_, sandbox_);
    const auto outcome = backend.Run("print(1)", Python(), "", std::chrono::seconds(5));
    ASSERT_TRUE(outcome.launch_error.empty()) << outcome.launch_error;
    EXPECT_EQ(outcome.stdout_text, "755\n");
}

TEST_F(ContainerBackendTest, TimedOutRunRemovesContainer) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ScopedEnv mode("FAKE_DOCKER_MODE", "sleep");
    ContainerBackend backend(container_, sandbox_);
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = backend.Run("while True: pass", Python(), "", std::chrono::milliseconds(500));
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_NE(Calls().find("rm -f -v coderun-"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_empty(scratch_.Path()));
}

TEST_F(ContainerBackendTest, KilledContainerIsResourceExceeded) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ScopedEnv mode("FAKE_DOCKER_MODE", "oom");
    ContainerBackend backend(container_, sandbox_);
    const auto outcome = backend.Run("x = ' ' * 10**10", Python(), "", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.resource_exceeded);
    EXPECT_EQ(outcome.exit_code.value_or(-1), 137);
}

TEST_F(ContainerBackendTest, DaemonErrorIsLaunchError) {
    ScopedEnv log("FAKE_DOCKER_LOG", log_path_);
    ScopedEnv mode("FAKE_DOCKER_MODE", "daemon");
    ContainerBackend backend(container_, sandbox_);
    const auto outcome = backend.Run("print(1)", Python(), "", std::chrono::seconds(5));
    EXPECT_NE(outcome.launch_error.find("pull access denied"), std::string::npos);
}
