#include <gtest/gtest.h>

#include "action/action.hpp"
#include "action/action_registry.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace stavily;

namespace {

Json execute(PluginContext& context, const std::string& id, const Json& parameters) {
    return send_json(context, Json{{"action", "execute_action"},
                                   {"action_request", {{"id", id}, {"parameters", parameters}}}});
}

Json initialize(PluginContext& context, const Json& config = Json::object()) {
    return send_json(context, Json{{"action", "initialize"}, {"config", config}});
}

} // namespace

TEST(Dispatcher, GetInfoDescribesPlugin) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    auto response = send_action(context, "get_info");
    ASSERT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["data"]["id"], "fake-trigger");
    EXPECT_EQ(response["data"]["type"], "trigger");
    EXPECT_EQ(response["data"]["capabilities"], Json::array({"trigger"}));
    EXPECT_EQ(response["data"]["demo_mode"], true);
    EXPECT_EQ(context.lifecycle.state(), PluginState::Uninitialized);
}

TEST(Dispatcher, FullTriggerLifecycle) {
    FakeTrigger plugin;
    TriggerEvent event;
    event.id = "e1";
    event.type = "fake.alert";
    event.severity = "high";
    plugin.events = {event, event};
    PluginContext context(plugin, test_options());

    auto init = initialize(context, Json{{"threshold", 70}});
    ASSERT_TRUE(init["success"].get<bool>()) << init.dump();
    EXPECT_EQ(init["data"]["state"], "initialized");
    EXPECT_DOUBLE_EQ(plugin.threshold, 70.0);
    EXPECT_EQ(context.configuration["threshold"], 70);

    EXPECT_EQ(send_action(context, "start")["data"]["state"], "running");

    auto detected = send_action(context, "detect_triggers");
    ASSERT_TRUE(detected["success"].get<bool>());
    ASSERT_EQ(detected["data"].size(), 2u);
    EXPECT_EQ(detected["data"][0]["type"], "fake.alert");

    EXPECT_EQ(send_action(context, "stop")["data"]["state"], "stopped");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Stopped);
    EXPECT_EQ(plugin.stops, 1);
}

TEST(Dispatcher, InitializeAppliesDefaults) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    auto response = send_action(context, "initialize");
    ASSERT_TRUE(response["success"].get<bool>());
    EXPECT_DOUBLE_EQ(plugin.threshold, 80.0);
}

TEST(Dispatcher, InvalidConfigKeepsState) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    auto response = initialize(context, Json{{"threshold", 150}});
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(error_kind_of(response), "ValidationError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Uninitialized);
}

TEST(Dispatcher, UnknownActionIsUnsupported) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());

    auto response = send_action(context, "self_destruct");
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_TRUE(response["data"].is_null());
    EXPECT_EQ(error_kind_of(response), "UnsupportedAction");
}

TEST(Dispatcher, CapabilityCheckedBeforeState) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());

    // Uninitialized would also reject it, but the capability is reported first
    auto response = send_action(context, "detect_triggers");
    EXPECT_EQ(error_kind_of(response), "CapabilityMissing");
    EXPECT_EQ(error_kind_of(send_action(context, "get_trigger_config")), "CapabilityMissing");

    FakeTrigger trigger;
    PluginContext trigger_context(trigger, test_options());
    EXPECT_EQ(error_kind_of(send_action(trigger_context, "get_action_config")), "CapabilityMissing");
    EXPECT_EQ(error_kind_of(execute(trigger_context, "t1", Json::object())), "CapabilityMissing");
}

TEST(Dispatcher, DetectBeforeStartIsInvalidState) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    initialize(context);

    auto response = send_action(context, "detect_triggers");
    EXPECT_EQ(error_kind_of(response), "InvalidState");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Initialized);
}

TEST(Dispatcher, StartBeforeInitializeIsInvalidState) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    EXPECT_EQ(error_kind_of(send_action(context, "start")), "InvalidState");
    EXPECT_EQ(plugin.starts, 0);
}

TEST(Dispatcher, InitializeWhileRunningIsInvalidState) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    EXPECT_EQ(error_kind_of(initialize(context)), "InvalidState");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);
}

TEST(Dispatcher, StartWhileRunningIsIdempotent) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    auto again = send_action(context, "start");
    EXPECT_TRUE(again["success"].get<bool>());
    EXPECT_EQ(plugin.starts, 1);
}

TEST(Dispatcher, StopBeforeInitializeIsANoOp) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    auto response = send_action(context, "stop");
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["data"]["state"], "uninitialized");
    EXPECT_EQ(plugin.stops, 0);
}

TEST(Dispatcher, StopTwiceReleasesOnce) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    EXPECT_TRUE(send_action(context, "stop")["success"].get<bool>());
    EXPECT_TRUE(send_action(context, "stop")["success"].get<bool>());
    EXPECT_EQ(plugin.stops, 1);
    EXPECT_EQ(context.lifecycle.state(), PluginState::Stopped);
}

TEST(Dispatcher, RestartAfterStop) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");
    send_action(context, "stop");

    ASSERT_TRUE(initialize(context, Json{{"threshold", 10}})["success"].get<bool>());
    ASSERT_TRUE(send_action(context, "start")["success"].get<bool>());
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);
    EXPECT_EQ(plugin.starts, 2);
}

TEST(Dispatcher, StartFaultKeepsInitialized) {
    FakeTrigger plugin;
    plugin.fail_start = true;
    PluginContext context(plugin, test_options());
    initialize(context);

    auto response = send_action(context, "start");
    EXPECT_EQ(error_kind_of(response), "InternalError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Initialized);

    auto status = send_action(context, "get_status");
    EXPECT_NE(status["data"]["last_error"].get<std::string>().find("cannot open device"), std::string::npos);
}

TEST(Dispatcher, DetectFaultFailsPlugin) {
    FakeTrigger plugin;
    plugin.fail_detect = true;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    EXPECT_EQ(error_kind_of(send_action(context, "detect_triggers")), "InternalError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Failed);

    // Failed is absorbing without recovery
    EXPECT_EQ(error_kind_of(initialize(context)), "InvalidState");
    EXPECT_EQ(error_kind_of(send_action(context, "start")), "InvalidState");

    // Best-effort cleanup still runs and the plugin stays Failed
    auto stop = send_action(context, "stop");
    EXPECT_TRUE(stop["success"].get<bool>());
    EXPECT_EQ(stop["data"]["state"], "failed");
    EXPECT_EQ(plugin.stops, 1);
    EXPECT_EQ(context.lifecycle.state(), PluginState::Failed);
}

TEST(Dispatcher, UnserializableResultFailsPlugin) {
    FakeTrigger plugin;
    TriggerEvent event;
    event.id = "e1";
    event.type = "fake.raw";
    event.severity = "info";
    event.payload = Json{{"raw", "\xc3"}};
    plugin.events.push_back(event);

    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    auto response = send_action(context, "detect_triggers");
    EXPECT_EQ(error_kind_of(response), "InternalError");
    EXPECT_NE(response["error"]["message"].get<std::string>().find("not serializable"), std::string::npos);
    EXPECT_EQ(context.lifecycle.state(), PluginState::Failed);
}

TEST(Dispatcher, StopFaultFailsPlugin) {
    FakeTrigger plugin;
    plugin.fail_stop = true;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    EXPECT_EQ(error_kind_of(send_action(context, "stop")), "InternalError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Failed);
}

TEST(Dispatcher, RecoveryAllowedReinitializesFailedPlugin) {
    FakeTrigger plugin;
    plugin.fail_detect = true;
    PluginContext context(plugin, test_options(true));
    initialize(context);
    send_action(context, "start");
    send_action(context, "detect_triggers");
    ASSERT_EQ(context.lifecycle.state(), PluginState::Failed);

    EXPECT_TRUE(initialize(context)["success"].get<bool>());
    EXPECT_EQ(context.lifecycle.state(), PluginState::Initialized);
}

TEST(Dispatcher, QueriesWorkInFailedState) {
    FakeTrigger plugin;
    plugin.fail_detect = true;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");
    send_action(context, "detect_triggers");

    EXPECT_TRUE(send_action(context, "get_info")["success"].get<bool>());
    EXPECT_TRUE(send_action(context, "get_trigger_config")["success"].get<bool>());

    auto health = send_action(context, "get_health");
    ASSERT_TRUE(health["success"].get<bool>());
    EXPECT_EQ(health["data"]["status"], "unhealthy");
    EXPECT_EQ(health["data"]["state"], "failed");
    EXPECT_EQ(health["data"]["checks"]["lifecycle"]["outcome"], "fail");
}

TEST(Dispatcher, ExecuteEchoesRequestId) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    auto response = execute(context, "req-42", Json{{"message", "hi"}, {"repeat", 2}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    const auto& data = response["data"];
    EXPECT_EQ(data["id"], "req-42");
    EXPECT_EQ(data["status"], "completed");
    EXPECT_EQ(data["output"]["echo"], "hihi");
    EXPECT_FALSE(data["started_at"].get<std::string>().empty());
    EXPECT_FALSE(data["completed_at"].get<std::string>().empty());
    EXPECT_EQ(data["metadata"]["plugin_id"], "fake-action");
}

TEST(Dispatcher, ExecuteValidatesParameters) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    auto missing = execute(context, "r1", Json::object());
    EXPECT_EQ(error_kind_of(missing), "ValidationError");

    auto too_long = execute(context, "r2", Json{{"message", std::string(40, 'x')}, {"repeat", 9}});
    EXPECT_EQ(error_kind_of(too_long), "ValidationError");
    std::string message = too_long["error"]["message"];
    EXPECT_NE(message.find("message"), std::string::npos);
    EXPECT_NE(message.find("repeat"), std::string::npos);

    EXPECT_EQ(plugin.executed, 0);
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);
}

TEST(Dispatcher, ExecuteRequiresActionRequest) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    EXPECT_EQ(error_kind_of(send_action(context, "execute_action")), "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "", Json{{"message", "x"}})), "ValidationError");
}

TEST(Dispatcher, ExecuteBeforeStartIsInvalidState) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());
    initialize(context);

    EXPECT_EQ(error_kind_of(execute(context, "r1", Json{{"message", "x"}})), "InvalidState");
}

TEST(Dispatcher, ActionConfigDescribesParameters) {
    FakeAction plugin;
    PluginContext context(plugin, test_options());

    auto response = send_action(context, "get_action_config");
    ASSERT_TRUE(response["success"].get<bool>());
    const auto& data = response["data"];
    EXPECT_EQ(data["schema"]["message"]["type"], "string");
    EXPECT_EQ(data["required"], Json::array({"message"}));
    EXPECT_EQ(data["timeout"], 60);
    EXPECT_TRUE(data["config"]["schema"].is_object());
}

TEST(Dispatcher, HealthSurvivesThrowingCheck) {
    FakeTrigger plugin;
    plugin.fail_health = true;
    PluginContext context(plugin, test_options());
    initialize(context);
    send_action(context, "start");

    auto health = send_action(context, "get_health");
    ASSERT_TRUE(health["success"].get<bool>());
    EXPECT_EQ(health["data"]["status"], "unhealthy");
    EXPECT_EQ(health["data"]["checks"]["plugin"]["outcome"], "fail");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);
}

TEST(Dispatcher, StatusCountsRequestsAndErrors) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());
    send_action(context, "get_info");
    send_action(context, "bogus");

    auto status = send_action(context, "get_status");
    EXPECT_EQ(status["data"]["state"], "uninitialized");
    EXPECT_EQ(status["data"]["requests"], 3);
    EXPECT_EQ(status["data"]["errors"], 1);
    EXPECT_EQ(status["data"]["uptime"], 0.0);
}

TEST(Dispatcher, MalformedLineIsProtocolError) {
    FakeTrigger plugin;
    PluginContext context(plugin, test_options());

    auto response = Json::parse(actions::handle_action("{not json", context));
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(error_kind_of(response), "ProtocolError");
    EXPECT_EQ(context.error_count, 1u);
}

TEST(ActionRegistry, RejectsDuplicateHandlers) {
    actions::ActionRegistry registry;
    actions::register_lifecycle_actions(registry);
    EXPECT_THROW(actions::register_lifecycle_actions(registry), std::logic_error);
    EXPECT_THROW(registry.add(nullptr), std::logic_error);

    EXPECT_NE(registry.find("start"), nullptr);
    EXPECT_EQ(registry.find("get_health"), nullptr);
    EXPECT_EQ(registry.find("restart"), nullptr);
}
