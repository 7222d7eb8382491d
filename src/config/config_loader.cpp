#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnv(const std::string& name) {
    return GetEnv(name.c_str());
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODERUN_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".coderun" / "config.json";
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::invalid_argument("negative");
        }
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring invalid size '" + value + "'");
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

// "PYTHON" style key for CODERUN_LANGUAGES__<ID>__* variables.
std::string EnvKey(const std::string& language) {
    std::string key;
    for (unsigned char c : language) {
        key.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
    }
    return key;
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (source.contains(key) && source[key].is_number_unsigned()) {
        target = source[key].get<std::size_t>();
    }
}

void ApplyLanguageFromJson(Config& config, const std::string& raw_id, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    const auto id = utils::ToLower(raw_id);
    const bool known = config.languages.count(id) > 0;
    LanguageConfig language = known ? config.languages[id] : LanguageConfig{};

    if (source.contains("image") && source["image"].is_string()) {
        language.image = source["image"].get<std::string>();
    }
    if (source.contains("command") && source["command"].is_array()) {
        language.command.clear();
        for (const auto& item : source["command"]) {
            if (item.is_string()) {
                language.command.push_back(item.get<std::string>());
            }
        }
    }
    if (source.contains("extension") && source["extension"].is_string()) {
        language.extension = source["extension"].get<std::string>();
    }
    if (source.contains("timeoutS") && source["timeoutS"].is_number_integer()) {
        language.timeout_s = source["timeoutS"].get<int>();
    }
    if (source.contains("memoryLimitMb") && source["memoryLimitMb"].is_number_integer()) {
        language.memory_limit_mb = source["memoryLimitMb"].get<int>();
    }
    if (source.contains("networkDisabled") && source["networkDisabled"].is_boolean()) {
        language.network_disabled = source["networkDisabled"].get<bool>();
    }

    if (language.command.empty() || language.extension.empty()) {
        utils::LogWarn("config", "language '" + id + "' needs command and extension; skipped");
        return;
    }
    if (language.timeout_s <= 0 || language.memory_limit_mb <= 0) {
        utils::LogWarn("config", "language '" + id + "' has non-positive limits; skipped");
        return;
    }
    config.languages[id] = std::move(language);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("useContainers") && sandbox["useContainers"].is_boolean()) {
            config.sandbox.use_containers = sandbox["useContainers"].get<bool>();
        }
        if (sandbox.contains("processFallback") && sandbox["processFallback"].is_boolean()) {
            config.sandbox.process_fallback = sandbox["processFallback"].get<bool>();
        }
        ReadSize(sandbox, "maxOutputBytes", config.sandbox.max_output_bytes);
        ReadSize(sandbox, "maxCodeBytes", config.sandbox.max_code_bytes);
        ReadSize(sandbox, "maxStdinBytes", config.sandbox.max_stdin_bytes);
        ReadSize(sandbox, "maxFileBytes", config.sandbox.max_file_bytes);
        ReadSize(sandbox, "maxProcesses", config.sandbox.max_processes);
        if (sandbox.contains("dispatchBudgetMs") && sandbox["dispatchBudgetMs"].is_number_integer()) {
            config.sandbox.dispatch_budget_ms = sandbox["dispatchBudgetMs"].get<int>();
        }
        if (sandbox.contains("processNetworkNamespace") && sandbox["processNetworkNamespace"].is_boolean()) {
            config.sandbox.process_network_namespace = sandbox["processNetworkNamespace"].get<bool>();
        }
        if (sandbox.contains("scratchRoot") && sandbox["scratchRoot"].is_string()) {
            config.sandbox.scratch_root = sandbox["scratchRoot"].get<std::string>();
        }
    }

    if (data.contains("container") && data["container"].is_object()) {
        const auto& container = data["container"];
        if (container.contains("dockerBinary") && container["dockerBinary"].is_string()) {
            config.container.docker_binary = container["dockerBinary"].get<std::string>();
        }
        if (container.contains("cpus") && container["cpus"].is_number()) {
            config.container.cpus = container["cpus"].get<double>();
        }
        if (container.contains("pidsLimit") && container["pidsLimit"].is_number_integer()) {
            config.container.pids_limit = container["pidsLimit"].get<int>();
        }
        if (container.contains("user") && container["user"].is_string()) {
            config.container.user = container["user"].get<std::string>();
        }
        if (container.contains("pullPolicy") && container["pullPolicy"].is_string()) {
            config.container.pull_policy = container["pullPolicy"].get<std::string>();
        }
        if (container.contains("tmpfsSizeMb") && container["tmpfsSizeMb"].is_number_integer()) {
            config.container.tmpfs_size_mb = container["tmpfsSizeMb"].get<int>();
        }
        if (container.contains("probeTimeoutS") && container["probeTimeoutS"].is_number_integer()) {
            config.container.probe_timeout_s = container["probeTimeoutS"].get<int>();
        }
        if (container.contains("innerTimeout") && container["innerTimeout"].is_boolean()) {
            config.container.inner_timeout = container["innerTimeout"].get<bool>();
        }
    }

    if (data.contains("languages") && data["languages"].is_object()) {
        for (const auto& [id, language] : data["languages"].items()) {
            ApplyLanguageFromJson(config, id, language);
        }
    }
}

void ApplyConfigFile(Config& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::LogWarn("config", "cannot open " + path.string() + "; using defaults");
        return;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("config", "failed to parse " + path.string() + ": " + ex.what() + "; using defaults");
    }
}

void ApplyEnvironment(Config& config) {
    const auto log_level = GetEnv("CODERUN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    const auto use_containers = GetEnvFallback(
        "CODERUN_SANDBOX__USE_CONTAINERS",
        "CODERUN_USE_CONTAINERS");
    if (!use_containers.empty()) {
        config.sandbox.use_containers = ParseBool(use_containers);
    }

    const auto process_fallback = GetEnv("CODERUN_SANDBOX__PROCESS_FALLBACK");
    if (!process_fallback.empty()) {
        config.sandbox.process_fallback = ParseBool(process_fallback);
    }

    const auto max_output = GetEnvFallback(
        "CODERUN_SANDBOX__MAX_OUTPUT_BYTES",
        "CODERUN_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.sandbox.max_output_bytes = ParseSize(max_output, config.sandbox.max_output_bytes);
    }

    const auto max_code = GetEnv("CODERUN_SANDBOX__MAX_CODE_BYTES");
    if (!max_code.empty()) {
        config.sandbox.max_code_bytes = ParseSize(max_code, config.sandbox.max_code_bytes);
    }

    const auto max_stdin = GetEnv("CODERUN_SANDBOX__MAX_STDIN_BYTES");
    if (!max_stdin.empty()) {
        config.sandbox.max_stdin_bytes = ParseSize(max_stdin, config.sandbox.max_stdin_bytes);
    }

    const auto max_processes = GetEnv("CODERUN_SANDBOX__MAX_PROCESSES");
    if (!max_processes.empty()) {
        config.sandbox.max_processes = ParseSize(max_processes, config.sandbox.max_processes);
    }

    const auto dispatch_budget = GetEnv("CODERUN_SANDBOX__DISPATCH_BUDGET_MS");
    if (!dispatch_budget.empty()) {
        config.sandbox.dispatch_budget_ms = ParseInt(dispatch_budget, config.sandbox.dispatch_budget_ms);
    }

    const auto scratch_root = GetEnv("CODERUN_SANDBOX__SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.sandbox.scratch_root = scratch_root;
    }

    const auto docker_binary = GetEnvFallback(
        "CODERUN_CONTAINER__DOCKER_BINARY",
        "CODERUN_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.container.docker_binary = docker_binary;
    }

    const auto cpus = GetEnv("CODERUN_CONTAINER__CPUS");
    if (!cpus.empty()) {
        config.container.cpus = ParseDouble(cpus, config.container.cpus);
    }

    const auto pids_limit = GetEnv("CODERUN_CONTAINER__PIDS_LIMIT");
    if (!pids_limit.empty()) {
        config.container.pids_limit = ParseInt(pids_limit, config.container.pids_limit);
    }

    for (auto& [id, language] : config.languages) {
        const auto prefix = "CODERUN_LANGUAGES__" + EnvKey(id) + "__";
        const auto timeout = GetEnv(prefix + "TIMEOUT_S");
        if (!timeout.empty()) {
            const auto value = ParseInt(timeout, language.timeout_s);
            if (value > 0) {
                language.timeout_s = value;
            }
        }
        const auto memory = GetEnv(prefix + "MEMORY_MB");
        if (!memory.empty()) {
            const auto value = ParseInt(memory, language.memory_limit_mb);
            if (value > 0) {
                language.memory_limit_mb = value;
            }
        }
    }
}

}  // namespace

std::map<std::string, LanguageConfig> DefaultLanguages() {
    std::map<std::string, LanguageConfig> languages;

    LanguageConfig python{};
    python.image = "python:3.11-alpine";
    python.command = {"python3"};
    python.extension = ".py";
    python.timeout_s = 30;
    python.memory_limit_mb = 128;
    languages["python"] = python;

    LanguageConfig javascript{};
    javascript.image = "node:18-alpine";
    javascript.command = {"node"};
    javascript.extension = ".js";
    javascript.timeout_s = 30;
    javascript.memory_limit_mb = 128;
    languages["javascript"] = javascript;

    LanguageConfig bash{};
    bash.image = "bash:5.2";
    bash.command = {"bash"};
    bash.extension = ".sh";
    bash.timeout_s = 15;
    bash.memory_limit_mb = 64;
    languages["bash"] = bash;

    return languages;
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    config.languages = DefaultLanguages();
    ApplyConfigFile(config, path);
    return config;
}

Config LoadConfig() {
    Config config{};
    config.languages = DefaultLanguages();
    ApplyConfigFile(config, GetConfigPath());
    ApplyEnvironment(config);
    return config;
}

}  // namespace coderun::config
