#include "disk_space_monitor.hpp"

#include "plugin_runner.hpp"

int main(int argc, char** argv) {
    stavily::plugins::DiskSpaceMonitor plugin;
    return stavily::run_plugin_main(plugin, argc, argv);
}
