#include "email_notification.hpp"

#include "command_runner.hpp"
#include "plugin_runner.hpp"

int main(int argc, char** argv) {
    stavily::plugins::EmailNotification plugin;
    stavily::plugins::kill_commands_on_termination();
    return stavily::run_plugin_main(plugin, argc, argv);
}
