#include "plugin_context.hpp"

namespace stavily {

PluginContext::PluginContext(Plugin& plugin_ref, RuntimeOptions runtime_options)
    : plugin(plugin_ref),
      options(std::move(runtime_options)),
      lifecycle(options.allow_recovery) {}

double PluginContext::uptime_seconds() const {
    if (!running_since) {
        return 0.0;
    }
    auto elapsed = std::chrono::steady_clock::now() - *running_since;
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace stavily
