/**
 * @file main.cpp
 * @brief runcage - Command-line interface
 * 
 * Runs a code snippet in a disposable, locked-down container and mirrors the
 * program's exit status. Also lists the supported languages and removes
 * leftover sandbox containers.
 * 
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "runcage/core/engine_config.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/core/sandbox_engine.hpp"
#include "runcage/utils/string_utils.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using runcage::utils::StringUtils;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/// Split "KEY=VALUE"; throws on a missing '='
std::pair<std::string, std::string> SplitAssignment(const std::string& text, const char* what) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error(std::string("Expected ") + what + " in the form KEY=VALUE: " + text);
    }
    return {text.substr(0, eq), text.substr(eq + 1)};
}

void PrintResult(const runcage::core::ExecutionResult& result) {
    std::cout << result.stdout_output;
    std::cerr << result.stderr_output;

    if (result.error_message) {
        spdlog::error("{}", *result.error_message);
    }
    spdlog::info("[DONE] {} exit={} time={:.3f}s container={}",
                 result.language, result.exit_code, result.execution_time_seconds,
                 result.container_id ? StringUtils::ShortId(*result.container_id) : "-");
}

void PrintLanguages(const std::vector<runcage::core::LanguageInfo>& languages) {
    std::cout << std::left
              << std::setw(12) << "ID"
              << std::setw(14) << "RUNTIME"
              << std::setw(6) << "EXT"
              << "IMAGE\n";
    for (const auto& info : languages) {
        std::cout << std::setw(12) << info.id
                  << std::setw(14) << info.display_name
                  << std::setw(6) << info.file_extension
                  << info.image << "\n";
    }
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"runcage - run untrusted code in disposable containers"};
    app.require_subcommand(1);

    std::string config_path;
    std::string backend_name;
    bool verbose = false;

    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--backend", backend_name, "Container backend: auto, api or cli");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute a code snippet");
    std::string language;
    std::string code_file;
    std::string code_text;
    int timeout_seconds = 30;
    std::string memory = "512m";
    bool network = false;
    bool writable = false;
    std::vector<std::string> env_args;
    std::vector<std::string> aux_args;
    std::string stdin_file;
    bool run_json = false;

    run_cmd->add_option("-l,--language", language, "Language identifier")->required();
    auto* file_opt = run_cmd->add_option("-f,--file", code_file, "Source file to run")
        ->check(CLI::ExistingFile);
    auto* code_opt = run_cmd->add_option("-c,--code", code_text, "Source code to run");
    file_opt->excludes(code_opt);
    run_cmd->add_option("--timeout", timeout_seconds, "Timeout in seconds (max 30)")
        ->default_val(30);
    run_cmd->add_option("--memory", memory, "Memory limit (e.g. 256m)")
        ->default_val("512m");
    run_cmd->add_flag("--network", network, "Allow network access");
    run_cmd->add_flag("--writable", writable, "Writable root filesystem");
    run_cmd->add_option("-e,--env", env_args, "Environment variable KEY=VALUE");
    run_cmd->add_option("--aux", aux_args, "Auxiliary file REL_PATH=HOST_FILE");
    run_cmd->add_option("--stdin", stdin_file, "File fed to standard input")
        ->check(CLI::ExistingFile);
    run_cmd->add_flag("--json", run_json, "Print the result as JSON");

    // languages
    auto* languages_cmd = app.add_subcommand("languages", "List supported languages");
    bool languages_json = false;
    languages_cmd->add_flag("--json", languages_json, "Print as JSON");

    // cleanup
    auto* cleanup_cmd = app.add_subcommand("cleanup", "Remove leftover sandbox containers");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr; stdout carries the program's output
    spdlog::set_default_logger(spdlog::stderr_color_mt("runcage"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        runcage::core::EngineConfig config;
        if (!config_path.empty()) {
            config = runcage::core::LoadEngineConfig(config_path);
        }
        if (!backend_name.empty()) {
            config.backend = runcage::backends::ParseBackendMode(backend_name);
        }

        // languages needs no container runtime
        if (languages_cmd->parsed()) {
            auto languages = runcage::core::LanguageRegistry::Default().ListLanguages();
            if (languages_json) {
                json list = json::array();
                for (const auto& info : languages) {
                    list.push_back({
                        {"id", info.id},
                        {"name", info.display_name},
                        {"extension", info.file_extension},
                        {"image", info.image},
                        {"description", info.description}
                    });
                }
                std::cout << list.dump(2) << std::endl;
            } else {
                PrintLanguages(languages);
            }
            return 0;
        }

        runcage::core::SandboxEngine engine(config);

        if (cleanup_cmd->parsed()) {
            auto removed = engine.CleanupOrphans();
            std::cout << "Removed " << removed << " container(s)" << std::endl;
            return 0;
        }

        if (code_file.empty() && code_opt->count() == 0) {
            spdlog::error("[ERROR] Either --file or --code is required");
            return 1;
        }

        runcage::core::ExecutionRequest request;
        request.language = language;
        request.code = code_file.empty() ? code_text : ReadFile(code_file);
        runcage::core::ResourceLimits::Builder limits(config.default_limits);
        if (run_cmd->count("--timeout") > 0) {
            limits.WithTimeoutSeconds(timeout_seconds);
        }
        if (run_cmd->count("--memory") > 0) {
            limits.WithMemory(memory);
        }
        request.limits = limits.Build();
        request.network_enabled = network;
        request.read_only = !writable;

        for (const auto& arg : env_args) {
            auto [key, value] = SplitAssignment(arg, "--env");
            request.env_vars[key] = value;
        }
        for (const auto& arg : aux_args) {
            auto [relative, host_file] = SplitAssignment(arg, "--aux");
            request.auxiliary_files[relative] = ReadFile(host_file);
        }
        if (!stdin_file.empty()) {
            request.stdin_input = ReadFile(stdin_file);
        }

        auto result = engine.Execute(request);

        if (run_json) {
            std::cout << runcage::core::ToJson(result).dump(2) << std::endl;
        } else {
            PrintResult(result);
        }

        if (result.exit_code < 0) {
            return 1;
        }
        return result.exit_code;

    } catch (const runcage::core::EngineError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
