#include "memory_monitor.hpp"

#include "plugin_runner.hpp"

int main(int argc, char** argv) {
    stavily::plugins::MemoryMonitor plugin;
    return stavily::run_plugin_main(plugin, argc, argv);
}
