#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "api/json_contract.hpp"
#include "config/config_loader.hpp"
#include "sandbox/sandbox_broker.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  coderun_cli run <language> <file|-> [--input <file>]\n"
              << "  coderun_cli exec        (JSON request on stdin)\n"
              << "  coderun_cli languages\n"
              << "  coderun_cli examples\n"
              << "  coderun_cli health" << std::endl;
}

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

int RunFile(coderun::sandbox::SandboxBroker& broker, int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return kExitUsage;
    }
    coderun::sandbox::ExecutionRequest request{};
    request.language = argv[2];

    const auto code = ReadSource(argv[3]);
    if (!code) {
        std::cerr << "cannot read " << argv[3] << std::endl;
        return kExitUsage;
    }
    request.code = *code;

    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            const auto input = ReadSource(argv[++i]);
            if (!input) {
                std::cerr << "cannot read " << argv[i] << std::endl;
                return kExitUsage;
            }
            request.stdin_data = *input;
        } else {
            std::cerr << "unknown argument: " << arg << std::endl;
            return kExitUsage;
        }
    }

    const auto result = broker.Execute(request);
    std::cout << result.stdout_text << std::flush;
    if (!result.stderr_text.empty()) {
        std::cerr << result.stderr_text;
    }
    if (!result.success) {
        std::cerr << "[run] " << coderun::sandbox::ToString(
                         result.error_kind.value_or(coderun::sandbox::ErrorKind::kRuntimeFailure))
                  << ": " << result.error << std::endl;
        return kExitFailed;
    }
    return kExitOk;
}

int ExecJson(coderun::sandbox::SandboxBroker& broker) {
    nlohmann::json payload;
    try {
        std::cin >> payload;
    } catch (const nlohmann::json::parse_error& ex) {
        nlohmann::json response = {
            {"success", false},
            {"error", std::string("invalid JSON: ") + ex.what()},
            {"error_kind", "ValidationError"},
            {"language", ""}
        };
        std::cout << response.dump(2) << std::endl;
        return kExitFailed;
    }
    const auto response = coderun::api::HandleExecute(broker, payload);
    std::cout << response.dump(2) << std::endl;
    return response.value("success", false) ? kExitOk : kExitFailed;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];

    const auto config = coderun::config::LoadConfig();
    coderun::utils::SetMinLogLevel(
        coderun::utils::ParseLogLevel(config.log_level, coderun::utils::LogLevel::kInfo));
    auto broker = coderun::sandbox::CreateBroker(config);

    if (command == "run") {
        return RunFile(*broker, argc, argv);
    }
    if (command == "exec") {
        return ExecJson(*broker);
    }
    if (command == "languages") {
        std::cout << coderun::api::BuildLanguagesJson(broker->Languages(), broker->ActiveBackendName()).dump(2)
                  << std::endl;
        return kExitOk;
    }
    if (command == "examples") {
        std::cout << coderun::api::BuildExamplesJson(broker->Examples()).dump(2) << std::endl;
        return kExitOk;
    }
    if (command == "health") {
        std::cout << coderun::api::BuildHealthJson(broker->Health()).dump(2) << std::endl;
        return kExitOk;
    }

    PrintUsage();
    return kExitUsage;
}
