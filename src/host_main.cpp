#include "environment.hpp"
#include "host/host_config.hpp"
#include "host/plugin_host.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <signal.h>

#ifndef STAVILY_VERSION_STRING
#define STAVILY_VERSION_STRING "unknown"
#endif
#ifndef STAVILY_GIT_VERSION_STRING
#define STAVILY_GIT_VERSION_STRING "unknown"
#endif
#ifndef STAVILY_BUILD_TIMESTAMP
#define STAVILY_BUILD_TIMESTAMP "unknown"
#endif

namespace {

constexpr int kUsageError = 2;
constexpr int kMaxFailureCode = 125;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config host.json] [--log-config file] [--demo|--no-demo] [--timeout ms] [plugin ...]"
              << std::endl;
}

std::optional<long> parse_positive(const char* text) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path;
    std::string log_config = stavily::get_env(stavily::kLogConfigEnv).value_or("log4cplus.ini");
    std::optional<bool> demo_mode;
    std::optional<long> timeout_ms;
    std::vector<std::string> plugin_paths;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << STAVILY_VERSION_STRING << std::endl;
            std::cout << "Commit: " << STAVILY_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << STAVILY_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            log_config = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-config=", 13) == 0) {
            log_config = argv[i] + 13;
            continue;
        }

        if (strcmp(argv[i], "--demo") == 0) {
            demo_mode = true;
            continue;
        }

        if (strcmp(argv[i], "--no-demo") == 0) {
            demo_mode = false;
            continue;
        }

        const char* timeout_text = nullptr;
        if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_text = argv[++i];
        } else if (strncmp(argv[i], "--timeout=", 10) == 0) {
            timeout_text = argv[i] + 10;
        }
        if (timeout_text) {
            timeout_ms = parse_positive(timeout_text);
            if (!timeout_ms) {
                std::cerr << "Invalid timeout: " << timeout_text << std::endl;
                return kUsageError;
            }
            continue;
        }

        if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return kUsageError;
        }

        plugin_paths.push_back(argv[i]);
    }

    init_logging(log_config);

    stavily::host::HostConfig config;
    if (!config_path.empty()) {
        try {
            config = stavily::host::load_host_config(config_path);
        } catch (const std::runtime_error& e) {
            LOG4CPLUS_ERROR(host_logger(), e.what());
            std::cerr << e.what() << std::endl;
            return kUsageError;
        }
    }

    for (const auto& path : plugin_paths) {
        config.plugins.push_back(stavily::host::plugin_entry_from_path(path));
    }
    if (config.plugins.empty()) {
        print_usage(argv[0]);
        return kUsageError;
    }

    if (demo_mode) {
        config.demo_mode = demo_mode;
    }
    if (timeout_ms) {
        // One deadline for every request kind
        std::chrono::milliseconds timeout(*timeout_ms);
        config.timeouts = stavily::host::CallTimeouts{timeout, timeout, timeout, timeout};
    }

    // A plugin dying mid-write must not take the host with it
    signal(SIGPIPE, SIG_IGN);

    LOG4CPLUS_INFO(host_logger(), "stavily-host " << STAVILY_VERSION_STRING << " checking "
                                                   << config.plugins.size() << " plugin(s)");

    stavily::host::PluginHost host(std::move(config));
    if (!host.start()) {
        std::cerr << "Failed to start the event loop" << std::endl;
        return 1;
    }

    auto reports = host.run_lifecycle_check([](const stavily::host::StepResult& step) {
        std::cout << (step.ok ? "ok   " : "FAIL ") << step.plugin << " " << step.step;
        if (!step.detail.empty()) {
            std::cout << ": " << step.detail;
        }
        std::cout << std::endl;
    });
    host.shutdown();

    int failed = 0;
    for (const auto& report : reports) {
        if (!report.passed) {
            ++failed;
        }
    }

    std::cout << (reports.size() - failed) << "/" << reports.size() << " plugin(s) passed" << std::endl;
    return std::min(failed, kMaxFailureCode);
}
