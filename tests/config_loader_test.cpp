#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"

using coderun::config::LoadConfig;
using coderun::config::LoadConfigFromFile;
using coderun::testing::ScopedEnv;
using coderun::testing::TempDir;

TEST(ConfigLoader, MissingFileKeepsDefaults) {
    TempDir dir;
    const auto config = LoadConfigFromFile(dir.Path() / "absent.json");
    EXPECT_TRUE(config.sandbox.use_containers);
    EXPECT_TRUE(config.sandbox.process_fallback);
    EXPECT_EQ(config.sandbox.max_code_bytes, 10000u);
    EXPECT_EQ(config.sandbox.max_processes, 256u);
    EXPECT_EQ(config.container.docker_binary, "docker");
    EXPECT_EQ(config.languages.size(), 3u);
}

TEST(ConfigLoader, FileOverridesSandboxAndLanguages) {
    TempDir dir;
    const auto path = dir.Write("config.json", R"({
        "logLevel": "debug",
        "sandbox": {"useContainers": false, "maxOutputBytes": 2048, "dispatchBudgetMs": 500, "maxProcesses": 40},
        "container": {"dockerBinary": "/usr/local/bin/podman", "cpus": 1.5, "pidsLimit": 32},
        "languages": {
            "Python": {"timeoutS": 10, "memoryLimitMb": 256},
            "ruby": {"image": "ruby:3.3-alpine", "command": ["ruby"], "extension": ".rb"}
        }
    })");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_FALSE(config.sandbox.use_containers);
    EXPECT_EQ(config.sandbox.max_output_bytes, 2048u);
    EXPECT_EQ(config.sandbox.dispatch_budget_ms, 500);
    EXPECT_EQ(config.sandbox.max_processes, 40u);
    EXPECT_EQ(config.container.docker_binary, "/usr/local/bin/podman");
    EXPECT_DOUBLE_EQ(config.container.cpus, 1.5);
    EXPECT_EQ(config.container.pids_limit, 32);

    const auto& python = config.languages.at("python");
    EXPECT_EQ(python.timeout_s, 10);
    EXPECT_EQ(python.memory_limit_mb, 256);
    EXPECT_EQ(python.image, "python:3.11-alpine");

    ASSERT_EQ(config.languages.count("ruby"), 1u);
    EXPECT_EQ(config.languages.at("ruby").extension, ".rb");
}

TEST(ConfigLoader, IncompleteNewLanguageIsSkipped) {
    TempDir dir;
    const auto path = dir.Write("config.json", R"({"languages": {"cobol": {"timeoutS": 5}}})");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.languages.count("cobol"), 0u);
}

TEST(ConfigLoader, MalformedFileKeepsDefaults) {
    TempDir dir;
    const auto path = dir.Write("config.json", "{ not json");
    const auto config = LoadConfigFromFile(path);
    EXPECT_TRUE(config.sandbox.use_containers);
    EXPECT_EQ(config.languages.at("python").timeout_s, 30);
}

TEST(ConfigLoader, EnvironmentOverridesFile) {
    TempDir dir;
    const auto path = dir.Write("config.json", R"({"sandbox": {"useContainers": true}})");
    ScopedEnv config_path("CODERUN_CONFIG", path.string());
    ScopedEnv use_containers("CODERUN_SANDBOX__USE_CONTAINERS", "false");
    ScopedEnv max_output("CODERUN_SANDBOX__MAX_OUTPUT_BYTES", "4096");
    ScopedEnv max_processes("CODERUN_SANDBOX__MAX_PROCESSES", "12");
    ScopedEnv python_timeout("CODERUN_LANGUAGES__PYTHON__TIMEOUT_S", "7");
    ScopedEnv bash_memory("CODERUN_LANGUAGES__BASH__MEMORY_MB", "not-a-number");

    const auto config = LoadConfig();
    EXPECT_FALSE(config.sandbox.use_containers);
    EXPECT_EQ(config.sandbox.max_output_bytes, 4096u);
    EXPECT_EQ(config.sandbox.max_processes, 12u);
    EXPECT_EQ(config.languages.at("python").timeout_s, 7);
    EXPECT_EQ(config.languages.at("bash").memory_limit_mb, 64);
}
