#include "api/json_contract.hpp"

#include <cmath>

#include "utils/common.hpp"

namespace coderun::api {
namespace {

double RoundMillis(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

}  // namespace

std::optional<sandbox::ExecutionRequest> ParseExecutionRequest(const nlohmann::json& payload,
                                                               std::string& error) {
    if (!payload.is_object()) {
        error = "no data provided";
        return std::nullopt;
    }
    sandbox::ExecutionRequest request{};
    if (!payload.contains("code") || !payload["code"].is_string()) {
        error = "code is required";
        return std::nullopt;
    }
    request.code = payload["code"].get<std::string>();
    if (!payload.contains("language") || !payload["language"].is_string()) {
        error = "a language must be specified";
        return std::nullopt;
    }
    request.language = utils::ToLower(payload["language"].get<std::string>());
    if (payload.contains("input") && !payload["input"].is_null()) {
        if (!payload["input"].is_string()) {
            error = "input must be a string";
            return std::nullopt;
        }
        request.stdin_data = payload["input"].get<std::string>();
    }
    return request;
}

nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["success"] = result.success;
    json["language"] = result.language;
    if (!result.success) {
        json["error"] = result.error;
        json["error_kind"] = result.error_kind ? sandbox::ToString(*result.error_kind) : "RuntimeFailure";
        if (result.backend.empty()) {
            // Rejected before anything ran.
            return json;
        }
    }
    json["output"] = result.stdout_text;
    if (!result.stderr_text.empty()) {
        json["stderr"] = result.stderr_text;
    }
    json["exit_code"] = result.exit_code ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr);
    json["execution_time"] = RoundMillis(result.duration_s);
    json["backend"] = result.backend;
    json["truncated"] = result.stdout_truncated || result.stderr_truncated;
    return json;
}

nlohmann::json BuildLanguagesJson(const std::vector<sandbox::LanguageSpec>& languages,
                                  const std::string& active_backend) {
    nlohmann::json names = nlohmann::json::array();
    nlohmann::json configurations = nlohmann::json::object();
    for (const auto& spec : languages) {
        names.push_back(spec.id);
        configurations[spec.id] = {
            {"extension", spec.extension},
            {"command", spec.command},
            {"image", spec.image},
            {"timeout", spec.timeout.count()},
            {"memory_limit", std::to_string(spec.MemoryLimitMb()) + "m"},
            {"network_disabled", spec.network_disabled}
        };
    }
    return {
        {"languages", names},
        {"active_backend", active_backend},
        {"docker_available", active_backend == "container"},
        {"configurations", configurations}
    };
}

nlohmann::json BuildExamplesJson(const std::map<std::string, std::string>& examples) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [language, code] : examples) {
        json[language] = code;
    }
    return {{"examples", json}};
}

nlohmann::json BuildHealthJson(const sandbox::HealthReport& report) {
    return {
        {"status", report.status},
        {"active_backend", report.active_backend},
        {"docker_available", report.container_available},
        {"supported_languages", report.languages}
    };
}

nlohmann::json HandleExecute(sandbox::SandboxBroker& broker, const nlohmann::json& payload) {
    std::string error;
    auto request = ParseExecutionRequest(payload, error);
    if (!request) {
        sandbox::ExecutionResult result{};
        if (payload.is_object() && payload.contains("language") && payload["language"].is_string()) {
            result.language = utils::ToLower(payload["language"].get<std::string>());
        }
        result.error_kind = sandbox::ErrorKind::kValidationError;
        result.error = error;
        return BuildResultJson(result);
    }
    return BuildResultJson(broker.Execute(*request));
}

}  // namespace coderun::api
