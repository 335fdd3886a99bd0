#include "test_helpers.hpp"

#include "action/action.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <stdexcept>

using namespace stavily;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging(STAVILY_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

const PluginDescriptor& FakeTrigger::descriptor() const {
    static const PluginDescriptor descriptor{
        "fake-trigger", "Fake Trigger", "Scripted trigger events", "0.1.0", "tests", {Capability::Trigger}, {"test"},
    };
    return descriptor;
}

ConfigSchema FakeTrigger::config_schema() const {
    ConfigSchema schema("Fake trigger configuration");
    schema.add("threshold", ParamType::Number, "Alert threshold").defaults_to(80.0).range(0.0, 100.0);
    schema.add("label", ParamType::String, "Free text");
    return schema;
}

void FakeTrigger::on_initialize(const Json& config, const RuntimeOptions& options) {
    (void)options;
    threshold = config.at("threshold").get<double>();
}

void FakeTrigger::on_start() {
    if (fail_start) {
        throw std::runtime_error("cannot open device");
    }
    ++starts;
}

void FakeTrigger::on_stop() {
    ++stops;
    if (fail_stop) {
        throw std::runtime_error("cannot release device");
    }
}

void FakeTrigger::collect_health(HealthReporter& reporter) const {
    if (fail_health) {
        throw std::runtime_error("health check crashed");
    }
    reporter.add_check("device", CheckResult::pass("reachable"));
    reporter.set_metrics(Json{{"threshold", threshold}});
}

std::vector<TriggerEvent> FakeTrigger::detect_triggers() {
    if (fail_detect) {
        throw std::runtime_error("sensor read failed");
    }
    return events;
}

const PluginDescriptor& FakeAction::descriptor() const {
    static const PluginDescriptor descriptor{
        "fake-action", "Fake Action", "Echoes its input", "0.2.0", "tests", {Capability::Action}, {"test"},
    };
    return descriptor;
}

ConfigSchema FakeAction::parameter_schema() const {
    ConfigSchema schema("Echo parameters");
    schema.add("message", ParamType::String, "Text to echo").required().longest(32);
    schema.add("repeat", ParamType::Integer, "Times to repeat").defaults_to(1).range(1, 5);
    return schema;
}

ActionResult FakeAction::execute_action(const ActionRequest& request) {
    ++executed;

    ActionResult result;
    // The dispatcher must overwrite this with the request id
    result.id = "not-the-request-id";
    result.status = "completed";
    std::string text;
    for (int64_t i = 0; i < request.parameters.at("repeat").get<int64_t>(); ++i) {
        text += request.parameters.at("message").get<std::string>();
    }
    result.output = Json{{"echo", text}};
    return result;
}

RuntimeOptions test_options(bool allow_recovery) {
    RuntimeOptions options;
    options.demo_mode = true;
    options.allow_recovery = allow_recovery;
    return options;
}

Json send_json(PluginContext& context, const Json& request) {
    std::string line = actions::handle_action(request.dump(), context);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    return Json::parse(line);
}

Json send_action(PluginContext& context, const std::string& action) {
    return send_json(context, Json{{"action", action}});
}

std::string error_kind_of(const Json& response) {
    const Json* error = codec::find_key(response, "error");
    if (!error || !error->is_object()) {
        return "";
    }
    return codec::as_string(error->value("kind", Json()), "");
}

host::ProcessOptions shell_plugin(const std::string& script) {
    host::ProcessOptions options;
    options.executable = "/bin/sh";
    options.args = {"-c", script};
    return options;
}

host::ProcessOptions built_plugin(const std::string& path) {
    host::ProcessOptions options;
    options.executable = path;
    options.env[kDemoModeEnv] = "true";
    options.env[kLogConfigEnv] = STAVILY_TEST_LOG_CONFIG;
    return options;
}
