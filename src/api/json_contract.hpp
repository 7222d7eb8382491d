#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sandbox/language_registry.hpp"
#include "sandbox/sandbox_broker.hpp"
#include "sandbox/types.hpp"

namespace coderun::api {

// {code, language, input?}. Returns std::nullopt and sets error when the
// payload does not have that shape.
std::optional<sandbox::ExecutionRequest> ParseExecutionRequest(const nlohmann::json& payload,
                                                               std::string& error);

nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result);
nlohmann::json BuildLanguagesJson(const std::vector<sandbox::LanguageSpec>& languages,
                                  const std::string& active_backend);
nlohmann::json BuildExamplesJson(const std::map<std::string, std::string>& examples);
nlohmann::json BuildHealthJson(const sandbox::HealthReport& report);

// The execute call as seen by the HTTP layer: request JSON in, result JSON out.
nlohmann::json HandleExecute(sandbox::SandboxBroker& broker, const nlohmann::json& payload);

}  // namespace coderun::api
