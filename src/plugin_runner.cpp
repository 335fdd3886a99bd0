#include "plugin_runner.hpp"

#include "action/action.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <iostream>

#include <signal.h>

namespace stavily {

PluginRunner::PluginRunner(Plugin& plugin, RuntimeOptions options)
    : context_(plugin, std::move(options)) {}

std::string PluginRunner::handle_line(const std::string& line) {
    return actions::handle_action(line, context_);
}

int PluginRunner::run(std::istream& in, std::ostream& out) {
    const auto& descriptor = context_.plugin.descriptor();
    LOG4CPLUS_INFO(plugin_logger(), descriptor.id << " " << descriptor.version << " serving requests");

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        out << handle_line(line) << '\n';
        out.flush();
        if (!out) {
            LOG4CPLUS_ERROR(plugin_logger(), "Output stream closed, exiting");
            return 1;
        }
    }

    // End of input: release whatever is still held
    PluginState state = context_.lifecycle.state();
    if (state == PluginState::Running || state == PluginState::Initialized) {
        RequestEnvelope stop;
        stop.action = action_name(Action::Stop);
        auto response = actions::dispatch(stop, context_);
        if (!response.success) {
            LOG4CPLUS_WARN(plugin_logger(), "Cleanup at end of input failed: " << response.error->message);
        }
    }

    LOG4CPLUS_INFO(plugin_logger(), descriptor.id << " exiting");
    return 0;
}

int run_plugin_main(Plugin& plugin, int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    RuntimeOptions options = RuntimeOptions::from_environment();

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            const auto& descriptor = plugin.descriptor();
            std::cout << descriptor.name << " " << descriptor.version << std::endl;
            return 0;
        }
        if (strcmp(argv[i], "--demo") == 0) {
            options.demo_mode = true;
            continue;
        }
        if (strcmp(argv[i], "--no-demo") == 0) {
            options.demo_mode = false;
            continue;
        }
        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            options.log_config = argv[++i];
            continue;
        }
        if (strncmp(argv[i], "--log-config=", 13) == 0) {
            options.log_config = argv[i] + 13;
            continue;
        }
    }

    init_logging(options.log_config);

    // Host going away mid-write must not kill the plugin with SIGPIPE
    signal(SIGPIPE, SIG_IGN);
    std::ios::sync_with_stdio(false);

    PluginRunner runner(plugin, options);
    return runner.run(std::cin, std::cout);
}

} // namespace stavily
