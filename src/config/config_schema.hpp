#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace coderun::config {

struct LanguageConfig {
    std::string image;
    std::vector<std::string> command;
    std::string extension;
    int timeout_s = 30;
    int memory_limit_mb = 128;
    bool network_disabled = true;
};

struct SandboxConfig {
    bool use_containers = true;
    bool process_fallback = true;
    std::size_t max_output_bytes = 64 * 1024;
    std::size_t max_code_bytes = 10000;
    std::size_t max_stdin_bytes = 64 * 1024;
    std::size_t max_file_bytes = 16 * 1024 * 1024;
    // RLIMIT_NPROC for process-backend runs; counted per user.
    std::size_t max_processes = 256;
    int dispatch_budget_ms = 2000;
    bool process_network_namespace = false;
    std::string scratch_root;
};

struct ContainerConfig {
    std::string docker_binary = "docker";
    double cpus = 0.5;
    int pids_limit = 64;
    std::string user = "65534:65534";
    std::string pull_policy = "missing";
    int tmpfs_size_mb = 10;
    int probe_timeout_s = 5;
    // Wrap the command in `timeout -s KILL` inside the container.
    bool inner_timeout = true;
};

struct Config {
    std::string log_level = "info";
    SandboxConfig sandbox;
    ContainerConfig container;
    std::map<std::string, LanguageConfig> languages;
};

// Built-in language table: bash, javascript and python.
std::map<std::string, LanguageConfig> DefaultLanguages();

}  // namespace coderun::config
