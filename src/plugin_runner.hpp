#pragma once

#include "environment.hpp"
#include "plugin.hpp"
#include "plugin_context.hpp"

#include <iosfwd>
#include <string>

namespace stavily {

/**
 * Request loop of a plugin process: one request line in, one response line
 * out, until end of input. Malformed lines are answered and skipped.
 */
class PluginRunner {
public:
    PluginRunner(Plugin& plugin, RuntimeOptions options);

    /// Serve requests from in to out. Returns the process exit code.
    int run(std::istream& in, std::ostream& out);

    /// Handle a single request line, returning the response line.
    std::string handle_line(const std::string& line);

    PluginContext& context() { return context_; }

private:
    PluginContext context_;
};

/**
 * Entry point for plugin executables: sets up logging from the environment,
 * serves stdin/stdout and releases the plugin's resources at end of input.
 */
int run_plugin_main(Plugin& plugin, int argc, char** argv);

} // namespace stavily
