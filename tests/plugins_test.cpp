#include <gtest/gtest.h>

#include "command_runner.hpp"
#include "disk_space_monitor.hpp"
#include "email_notification.hpp"
#include "errors.hpp"
#include "memory_monitor.hpp"
#include "shell_command.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

using namespace stavily;
using namespace stavily::plugins;
using namespace std::chrono_literals;

namespace {

const char* kMeminfo =
    "MemTotal:        1000000 kB\n"
    "MemFree:          100000 kB\n"
    "MemAvailable:     250000 kB\n"
    "Buffers:           20000 kB\n"
    "Cached:           300000 kB\n"
    "SwapTotal:        200000 kB\n"
    "SwapFree:          50000 kB\n";

// Temporary file removed at scope exit.
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        char path[] = "/tmp/stavily-test-XXXXXX";
        int fd = ::mkstemp(path);
        EXPECT_GE(fd, 0);
        ::close(fd);
        path_ = path;
        std::ofstream(path_) << content;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

template <typename P>
void configure(P& plugin, const Json& config, bool demo_mode = true) {
    RuntimeOptions options = test_options();
    options.demo_mode = demo_mode;
    plugin.on_initialize(plugin.config_schema().apply(config), options);
}

FilesystemUsage usage(const std::string& mountpoint, double percent) {
    FilesystemUsage fs;
    fs.device = "/dev/sda1";
    fs.mountpoint = mountpoint;
    fs.fstype = "ext4";
    fs.total = 100ull * 1024 * 1024 * 1024;
    fs.used = static_cast<uint64_t>(fs.total * percent / 100.0);
    fs.free = fs.total - fs.used;
    fs.percent = percent;
    return fs;
}

MemorySample memory(double percent, double swap_percent, uint64_t swap_total = 1024) {
    MemorySample sample;
    sample.total = 1000;
    sample.used = static_cast<uint64_t>(percent * 10);
    sample.available = sample.total - sample.used;
    sample.percent = percent;
    sample.swap_total = swap_total;
    sample.swap_percent = swap_percent;
    sample.taken_at = std::chrono::system_clock::now();
    return sample;
}

Json execute(PluginContext& context, const std::string& id, const Json& parameters) {
    return send_json(context, Json{{"action", "execute_action"},
                                   {"action_request", {{"id", id}, {"parameters", parameters}}}});
}

void start(PluginContext& context, const Json& config = Json::object()) {
    auto init = send_json(context, Json{{"action", "initialize"}, {"config", config}});
    ASSERT_TRUE(init["success"].get<bool>()) << init.dump();
    ASSERT_TRUE(send_action(context, "start")["success"].get<bool>());
}

} // namespace

TEST(DiskSpaceMonitor, WarningAndCriticalLevels) {
    DiskSpaceMonitor monitor;
    configure(monitor, Json::object());

    auto now = std::chrono::steady_clock::now();
    auto events = monitor.evaluate({usage("/", 50.0), usage("/var", 90.0), usage("/home", 97.5)}, now);
    ASSERT_EQ(events.size(), 2u);

    EXPECT_EQ(events[0].type, "disk.space.warning");
    EXPECT_EQ(events[0].severity, "high");
    EXPECT_EQ(events[0].id.rfind("disk-warning-_var-", 0), 0u) << events[0].id;
    EXPECT_EQ(events[0].payload["threshold"], 85.0);
    EXPECT_EQ(events[0].payload["filesystem"]["mountpoint"], "/var");

    EXPECT_EQ(events[1].type, "disk.space.critical");
    EXPECT_EQ(events[1].severity, "critical");
    EXPECT_EQ(events[1].payload["usage_percent"], 97.5);
    EXPECT_EQ(events[1].source, "disk-space-monitor");
    EXPECT_EQ(events[1].tags.back(), "critical");
}

TEST(DiskSpaceMonitor, CooldownPerMountAndLevel) {
    DiskSpaceMonitor monitor;
    configure(monitor, Json{{"alert_cooldown", 600}});

    auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(monitor.evaluate({usage("/", 90.0)}, now).size(), 1u);
    EXPECT_TRUE(monitor.evaluate({usage("/", 90.0)}, now + 10s).empty());

    // Escalating to critical is a different alert
    EXPECT_EQ(monitor.evaluate({usage("/", 99.0)}, now + 20s).size(), 1u);
    EXPECT_EQ(monitor.evaluate({usage("/var", 90.0)}, now + 30s).size(), 1u);

    EXPECT_EQ(monitor.evaluate({usage("/", 90.0)}, now + 601s).size(), 1u);
}

TEST(DiskSpaceMonitor, RejectsInvertedThresholds) {
    DiskSpaceMonitor monitor;
    try {
        configure(monitor, Json{{"threshold", 95}, {"critical_threshold", 90}});
        FAIL() << "expected a validation error";
    } catch (const PluginError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
    EXPECT_THROW(configure(monitor, Json{{"alert_cooldown", 10}}), PluginError);
}

TEST(DiskSpaceMonitor, ScanHonoursExcludesAndSkipsMissingMounts) {
    TempFile mounts(
        "/dev/root / ext4 rw,relatime 0 0\n"
        "proc /proc proc rw 0 0\n"
        "tmpfs /tmp tmpfs rw 0 0\n"
        "/dev/sdz1 /nonexistent/stavily ext4 rw 0 0\n");
    DiskSpaceMonitor monitor(mounts.path());
    configure(monitor, Json{{"monitored_paths", Json::array()}});

    auto filesystems = monitor.scan();
    ASSERT_EQ(filesystems.size(), 1u);
    EXPECT_EQ(filesystems[0].mountpoint, "/");
    EXPECT_GT(filesystems[0].total, 0u);
    EXPECT_GE(filesystems[0].percent, 0.0);
    EXPECT_LE(filesystems[0].percent, 100.0);
}

TEST(DiskSpaceMonitor, UnreadableMountTableFailsHealth) {
    DiskSpaceMonitor monitor("/nonexistent/mounts");
    configure(monitor, Json::object());
    EXPECT_THROW(monitor.scan(), PluginError);

    HealthReporter reporter;
    monitor.collect_health(reporter);
    auto report = reporter.build(PluginState::Running, std::nullopt, 1.0);
    EXPECT_EQ(report.checks.at("disk-accessible").outcome, CheckOutcome::Fail);
    EXPECT_EQ(report.status, HealthStatus::Unhealthy);
}

TEST(DiskSpaceMonitor, DetectsThroughDispatcher) {
    TempFile mounts("/dev/root / ext4 rw 0 0\n");
    DiskSpaceMonitor monitor(mounts.path());
    PluginContext context(monitor, test_options());
    // Zero threshold fires on any used filesystem
    start(context, Json{{"threshold", 0}, {"critical_threshold", 100}});

    auto response = send_action(context, "detect_triggers");
    ASSERT_TRUE(response["success"].get<bool>());
    for (const auto& event : response["data"]) {
        EXPECT_EQ(event["type"], "disk.space.warning");
    }

    auto health = send_action(context, "get_health");
    EXPECT_EQ(health["data"]["checks"]["disk-accessible"]["outcome"], "pass");
    EXPECT_TRUE(health["data"]["metrics"].contains("highest_usage"));
}

TEST(MemoryMonitor, ParsesMeminfo) {
    std::istringstream in(kMeminfo);
    MemorySample sample = parse_meminfo(in);

    EXPECT_EQ(sample.total, 1000000ull * 1024);
    EXPECT_EQ(sample.available, 250000ull * 1024);
    EXPECT_DOUBLE_EQ(sample.percent, 75.0);
    EXPECT_EQ(sample.swap_used, 150000ull * 1024);
    EXPECT_DOUBLE_EQ(sample.swap_percent, 75.0);
}

TEST(MemoryMonitor, FallsBackWithoutMemAvailable) {
    std::istringstream in(
        "MemTotal: 1000 kB\n"
        "MemFree: 100 kB\n"
        "Buffers: 50 kB\n"
        "Cached: 250 kB\n");
    MemorySample sample = parse_meminfo(in);
    EXPECT_EQ(sample.available, 400ull * 1024);
    EXPECT_EQ(sample.swap_total, 0u);
    EXPECT_DOUBLE_EQ(sample.swap_percent, 0.0);
}

TEST(MemoryMonitor, MissingTotalIsInternalError) {
    std::istringstream in("MemFree: 100 kB\n");
    try {
        parse_meminfo(in);
        FAIL() << "expected an error";
    } catch (const PluginError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InternalError);
    }
}

TEST(MemoryMonitor, SeverityLevels) {
    MemoryMonitor monitor;
    configure(monitor, Json{{"alert_cooldown", 0}});
    auto now = std::chrono::steady_clock::now();

    EXPECT_TRUE(monitor.evaluate(memory(80.0, 0.0), now).empty());

    auto medium = monitor.evaluate(memory(87.0, 0.0), now);
    ASSERT_EQ(medium.size(), 1u);
    EXPECT_EQ(medium[0].type, "memory.high");
    EXPECT_EQ(medium[0].severity, "medium");

    EXPECT_EQ(monitor.evaluate(memory(92.0, 0.0), now)[0].severity, "high");
    EXPECT_EQ(monitor.evaluate(memory(96.0, 0.0), now)[0].severity, "critical");

    auto swap = monitor.evaluate(memory(10.0, 93.0), now);
    ASSERT_EQ(swap.size(), 1u);
    EXPECT_EQ(swap[0].type, "swap.high");
    EXPECT_EQ(swap[0].severity, "high");
    EXPECT_EQ(swap[0].payload["threshold"], 90.0);

    EXPECT_TRUE(monitor.evaluate(memory(10.0, 99.0, 0), now).empty());
}

TEST(MemoryMonitor, CooldownPerKind) {
    MemoryMonitor monitor;
    configure(monitor, Json{{"alert_cooldown", 300}});
    auto now = std::chrono::steady_clock::now();

    EXPECT_EQ(monitor.evaluate(memory(97.0, 97.0), now).size(), 2u);
    EXPECT_TRUE(monitor.evaluate(memory(97.0, 97.0), now + 60s).empty());
    EXPECT_EQ(monitor.evaluate(memory(97.0, 97.0), now + 301s).size(), 2u);
}

TEST(MemoryMonitor, SamplerRunsWhileStarted) {
    TempFile meminfo(kMeminfo);
    MemoryMonitor monitor(meminfo.path());
    PluginContext context(monitor, test_options());
    start(context, Json{{"interval", 1}, {"threshold", 70}});

    EXPECT_TRUE(monitor.sampler_running());
    ASSERT_TRUE(monitor.latest_sample());
    EXPECT_DOUBLE_EQ(monitor.latest_sample()->percent, 75.0);

    auto detected = send_action(context, "detect_triggers");
    ASSERT_TRUE(detected["success"].get<bool>());
    ASSERT_EQ(detected["data"].size(), 1u);
    EXPECT_EQ(detected["data"][0]["type"], "memory.high");

    auto health = send_action(context, "get_health");
    EXPECT_EQ(health["data"]["checks"]["sampler-fresh"]["outcome"], "pass");
    EXPECT_EQ(health["data"]["checks"]["meminfo-readable"]["outcome"], "pass");

    ASSERT_TRUE(send_action(context, "stop")["success"].get<bool>());
    EXPECT_FALSE(monitor.sampler_running());
}

TEST(MemoryMonitor, StartFailsWithoutMeminfo) {
    MemoryMonitor monitor("/nonexistent/meminfo");
    PluginContext context(monitor, test_options());
    send_json(context, Json{{"action", "initialize"}});

    auto response = send_action(context, "start");
    EXPECT_EQ(error_kind_of(response), "InternalError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Initialized);
    EXPECT_FALSE(monitor.sampler_running());
}

TEST(EmailNotification, RendersPlainMessage) {
    EmailMessage message;
    message.from = "stavily@host";
    message.to = {"a@example.com", "b@example.com"};
    message.bcc = {"audit@example.com"};
    message.subject = "Disk full";
    message.body = "/var is at 97%";

    std::string text = render_message(message, "id-1@host");
    EXPECT_NE(text.find("To: a@example.com, b@example.com\n"), std::string::npos);
    EXPECT_NE(text.find("Bcc: audit@example.com\n"), std::string::npos);
    EXPECT_EQ(text.find("Cc:"), std::string::npos);
    EXPECT_NE(text.find("Message-ID: <id-1@host>\n"), std::string::npos);
    EXPECT_NE(text.find("text/plain"), std::string::npos);
    EXPECT_NE(text.find("\n\n/var is at 97%\n"), std::string::npos);
}

TEST(EmailNotification, RendersAlternativeWithHtml) {
    EmailMessage message;
    message.from = "stavily@host";
    message.to = {"a@example.com"};
    message.subject = "Report";
    message.body = "plain";
    message.html_body = "<b>rich</b>";

    std::string text = render_message(message, "m1");
    EXPECT_NE(text.find("multipart/alternative; boundary=\"stavily-m1\""), std::string::npos);
    EXPECT_NE(text.find("--stavily-m1\nContent-Type: text/html"), std::string::npos);
    EXPECT_NE(text.find("--stavily-m1--\n"), std::string::npos);
}

TEST(EmailNotification, DemoSendThroughDispatcher) {
    EmailNotification email;
    PluginContext context(email, test_options());
    start(context);

    auto response = execute(context, "t1", Json{{"to", "ops@example.com"}, {"cc", {"a@x", "b@x"}},
                                                {"subject", "hello"}, {"attachments", {"/tmp/report.pdf"}}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    const auto& data = response["data"];
    EXPECT_EQ(data["id"], "t1");
    EXPECT_EQ(data["status"], "sent");
    EXPECT_EQ(data["output"]["recipients"], Json::array({"ops@example.com"}));
    EXPECT_EQ(data["output"]["cc"].size(), 2u);
    EXPECT_EQ(data["output"]["attachments_count"], 1);
    EXPECT_EQ(data["output"]["demo_mode"], true);
    EXPECT_EQ(data["output"]["message_id"].get<std::string>().rfind("demo-t1-", 0), 0u);
}

TEST(EmailNotification, RejectsMissingFieldsAndHeaderInjection) {
    EmailNotification email;
    PluginContext context(email, test_options());
    start(context);

    EXPECT_EQ(error_kind_of(execute(context, "t1", Json{{"subject", "no recipients"}})), "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "t2", Json{{"to", "a@x"}})), "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "t3", Json{{"to", "a@x"}, {"subject", std::string(201, 's')}})),
              "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "t4", Json{{"to", "a@x"}, {"subject", "hi\nBcc: evil@x"}})),
              "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "t5", Json{{"to", "a@x\r\nBcc: evil@x"}, {"subject", "hi"}})),
              "ValidationError");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);
}

TEST(EmailNotification, RealModeNeedsExecutableSendmail) {
    EmailNotification email;
    EXPECT_THROW(configure(email, Json{{"sendmail_path", "/nonexistent/sendmail"}}, false), PluginError);
    EXPECT_NO_THROW(configure(email, Json{{"sendmail_path", "/nonexistent/sendmail"}}, true));
}

TEST(EmailNotification, RealModeReportsSendmailResult) {
    std::signal(SIGPIPE, SIG_IGN);
    ActionRequest request{"r1", Json{{"to", "ops@example.com"}, {"subject", "hi"}}};

    EmailNotification delivered;
    configure(delivered, Json{{"sendmail_path", "/bin/true"}}, false);
    EXPECT_EQ(delivered.execute_action(request).status, "sent");

    EmailNotification rejected;
    configure(rejected, Json{{"sendmail_path", "/bin/false"}}, false);
    ActionResult result = rejected.execute_action(request);
    EXPECT_EQ(result.status, "failed");
    EXPECT_EQ(result.error.value_or(""), "sendmail exited with code 1");
}

TEST(EmailNotification, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("a"), "YQ==");
    EXPECT_EQ(base64_encode("ab"), "YWI=");
    EXPECT_EQ(base64_encode("abc"), "YWJj");
    EXPECT_EQ(base64_encode(std::string("\xff\x00\x10", 3)), "/wAQ");
}

TEST(EmailNotification, LoadAttachmentsSkipsMissingFiles) {
    TempFile report("hello");
    auto attachments = load_attachments({report.path(), "/nonexistent/report.pdf", "/tmp"});
    ASSERT_EQ(attachments.size(), 1u);
    EXPECT_EQ(attachments[0].filename, report.path().substr(report.path().rfind('/') + 1));
    EXPECT_EQ(attachments[0].content, "hello");
}

TEST(EmailNotification, RendersMixedWithAttachments) {
    EmailMessage message;
    message.from = "stavily@host";
    message.to = {"a@example.com"};
    message.subject = "Report";
    message.body = "see attached";
    message.html_body = "<b>see attached</b>";
    message.attachments = {{"report.txt", "hello"}, {"big.bin", std::string(100, 'z')}};

    std::string text = render_message(message, "m2");
    EXPECT_NE(text.find("Content-Type: multipart/mixed; boundary=\"stavily-mixed-m2\"\n"), std::string::npos);
    EXPECT_NE(text.find("--stavily-mixed-m2\nContent-Type: multipart/alternative; boundary=\"stavily-m2\""),
              std::string::npos);
    EXPECT_NE(text.find("Content-Disposition: attachment; filename=\"report.txt\"\n\naGVsbG8=\n"),
              std::string::npos);
    EXPECT_NE(text.find("Content-Transfer-Encoding: base64\n"), std::string::npos);

    // Encoded lines stay within 76 columns
    std::string encoded = base64_encode(std::string(100, 'z'));
    EXPECT_NE(text.find(encoded.substr(0, 76) + "\n" + encoded.substr(76) + "\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 21), "--stavily-mixed-m2--\n");
}

TEST(EmailNotification, RealModeSendsAttachmentsToSendmail) {
    std::signal(SIGPIPE, SIG_IGN);
    TempFile captured("");
    TempFile sendmail("#!/bin/sh\ncat > " + captured.path() + "\n");
    ASSERT_EQ(::chmod(sendmail.path().c_str(), 0755), 0);
    TempFile report("disk report");

    EmailNotification email;
    configure(email, Json{{"sendmail_path", sendmail.path()}}, false);
    ActionResult result = email.execute_action(ActionRequest{
        "r1", Json{{"to", "ops@example.com"},
                   {"subject", "weekly"},
                   {"body", "attached"},
                   {"attachments", {report.path(), "/nonexistent/missing.log"}}}});

    EXPECT_EQ(result.status, "sent");
    ASSERT_TRUE(result.output);
    EXPECT_EQ((*result.output)["attachments_count"], 2);
    EXPECT_EQ((*result.output)["attached"], 1);

    std::ifstream in(captured.path());
    std::stringstream sent;
    sent << in.rdbuf();
    EXPECT_NE(sent.str().find("multipart/mixed"), std::string::npos);
    EXPECT_NE(sent.str().find(base64_encode("disk report")), std::string::npos);
    EXPECT_EQ(sent.str().find("missing.log"), std::string::npos);
}

TEST(ShellCommand, CommandName) {
    EXPECT_EQ(command_name("ls -la"), "ls");
    EXPECT_EQ(command_name("  /usr/bin/env FOO=1 ls"), "env");
    EXPECT_EQ(command_name("'my tool' --flag"), "my tool");
    EXPECT_EQ(command_name("ps|grep x"), "ps");
    EXPECT_EQ(command_name("true;rm -rf /"), "true");
    EXPECT_EQ(command_name(""), "");
}

TEST(ShellCommand, Policy) {
    ShellCommand shell;
    configure(shell, Json{{"allowed_commands", {"ls", "echo", "chmod"}}});

    EXPECT_FALSE(shell.check_policy("ls -la", "/tmp"));
    EXPECT_FALSE(shell.check_policy("echo hi", "/var/tmp/work"));
    EXPECT_EQ(shell.check_policy("rm file", "/tmp").value_or(""), "Command 'rm' is blocked for security");
    EXPECT_EQ(shell.check_policy("cat /etc/passwd", "/tmp").value_or(""), "Command 'cat' is not in allowed list");
    EXPECT_EQ(shell.check_policy("ls", "/etc").value_or(""), "Working directory '/etc' is not allowed");
    EXPECT_EQ(shell.check_policy("chmod 777 /tmp/x", "/tmp").value_or(""),
              "Command contains dangerous pattern: chmod 777");
    EXPECT_EQ(shell.check_policy("ECHO hi; RM -RF /", "/tmp").value_or(""), "Command 'ECHO' is not in allowed list");
    EXPECT_TRUE(shell.check_policy("   ", "/tmp"));
}

TEST(ShellCommand, DemoModeSimulates) {
    ShellCommand shell;
    PluginContext context(shell, test_options());
    start(context);

    auto response = execute(context, "s1", Json{{"command", "ls -la"}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["data"]["status"], "completed");
    EXPECT_EQ(response["data"]["output"]["working_dir"], "/tmp");
    EXPECT_EQ(response["data"]["output"]["demo_mode"], true);
    EXPECT_NE(response["data"]["output"]["stdout"].get<std::string>().find("file1.txt"), std::string::npos);
}

TEST(ShellCommand, PolicyViolationIsAFailedResult) {
    ShellCommand shell;
    PluginContext context(shell, test_options());
    start(context);

    auto response = execute(context, "s2", Json{{"command", "rm -rf /tmp/x"}});
    ASSERT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["data"]["id"], "s2");
    EXPECT_EQ(response["data"]["status"], "failed");
    EXPECT_EQ(response["data"]["error"], "Command 'rm' is blocked for security");
}

TEST(ShellCommand, TimeoutParameterIsBounded) {
    ShellCommand shell;
    PluginContext context(shell, test_options());
    start(context);

    EXPECT_EQ(error_kind_of(execute(context, "s3", Json{{"command", "ls"}, {"timeout", 0}})), "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "s4", Json{{"command", "ls"}, {"timeout", 3601}})), "ValidationError");
    EXPECT_EQ(error_kind_of(execute(context, "s5", Json::object())), "ValidationError");
}

TEST(PluginSchemas, RejectOutOfRangeIntegers) {
    ShellCommand shell;
    EXPECT_THROW(shell.config_schema().apply(Json{{"max_output_size", 1e20}}), PluginError);
    EXPECT_THROW(shell.config_schema().apply(Json{{"max_output_size", 64 * 1024 * 1024 + 1}}), PluginError);
    EXPECT_NO_THROW(shell.config_schema().apply(Json{{"max_output_size", 64 * 1024 * 1024}}));

    MemoryMonitor memory;
    EXPECT_THROW(memory.config_schema().apply(Json{{"interval", 1e300}}), PluginError);
    EXPECT_THROW(memory.config_schema().apply(Json{{"interval", 86401}}), PluginError);
    EXPECT_THROW(memory.config_schema().apply(Json{{"alert_cooldown", 1e18}}), PluginError);

    DiskSpaceMonitor disk;
    EXPECT_THROW(disk.config_schema().apply(Json{{"interval", 1e20}}), PluginError);
    EXPECT_NO_THROW(disk.config_schema().apply(Json{{"interval", 86400}}));
}

TEST(ShellCommand, RealModeRunsCommand) {
    std::signal(SIGPIPE, SIG_IGN);
    ShellCommand shell;
    configure(shell, Json::object(), false);

    ActionResult echo = shell.execute_action(
        ActionRequest{"r1", Json{{"command", "echo \"$GREETING\"; echo oops >&2; exit 3"},
                                 {"working_dir", "/tmp"},
                                 {"env_vars", {{"GREETING", "hello"}}}}});
    EXPECT_EQ(echo.status, "completed");
    ASSERT_TRUE(echo.output);
    EXPECT_EQ((*echo.output)["stdout"], "hello\n");
    EXPECT_EQ((*echo.output)["stderr"], "oops\n");
    EXPECT_EQ((*echo.output)["return_code"], 3);
    EXPECT_EQ((*echo.output)["demo_mode"], false);

    ActionResult piped =
        shell.execute_action(ActionRequest{"r2", Json{{"command", "tr a-z A-Z"}, {"working_dir", "/tmp"}, {"input", "abc"}}});
    EXPECT_EQ((*piped.output)["stdout"], "ABC");
}

TEST(ShellCommand, RealModeTimeoutAndTruncation) {
    std::signal(SIGPIPE, SIG_IGN);
    ShellCommand shell;
    configure(shell, Json{{"max_output_size", 16}}, false);

    ActionResult slow =
        shell.execute_action(ActionRequest{"r1", Json{{"command", "sleep 10"}, {"working_dir", "/tmp"}, {"timeout", 1}}});
    EXPECT_EQ(slow.status, "failed");
    EXPECT_EQ(slow.error.value_or(""), "command timed out after 1 seconds");

    ActionResult chatty = shell.execute_action(
        ActionRequest{"r2", Json{{"command", "head -c 1000 /dev/zero | tr '\\0' x"}, {"working_dir", "/tmp"}}});
    EXPECT_EQ(chatty.status, "completed");
    EXPECT_EQ((*chatty.output)["stdout"], std::string(16, 'x') + "\n... [output truncated]");
}

TEST(ShellCommand, RealModeOutputStaysValidUtf8) {
    std::signal(SIGPIPE, SIG_IGN);
    ShellCommand shell;
    RuntimeOptions options = test_options();
    options.demo_mode = false;
    PluginContext context(shell, options);
    start(context, Json{{"max_output_size", 3}});

    auto invalid = execute(context, "u1", Json{{"command", "printf '\\377'"}});
    ASSERT_TRUE(invalid["success"].get<bool>()) << invalid.dump();
    EXPECT_EQ(invalid["data"]["status"], "completed");
    EXPECT_EQ(invalid["data"]["output"]["stdout"], "\xef\xbf\xbd");
    EXPECT_EQ(context.lifecycle.state(), PluginState::Running);

    // Three bytes of output cut inside the second two-byte character
    auto capped = execute(context, "u2", Json{{"command", "printf '\\303\\251\\303\\251\\303\\251'"}});
    ASSERT_TRUE(capped["success"].get<bool>()) << capped.dump();
    EXPECT_EQ(capped["data"]["output"]["stdout"], "\xc3\xa9\n... [output truncated]");
}

TEST(CommandRunner, Utf8PrefixLength) {
    const std::string text = "a\xc3\xa9\xe2\x82\xac";    // a, e-acute, euro sign
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 100), text.size());
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 1), 1u);
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 2), 1u);
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 3), 3u);
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 5), 3u);
    EXPECT_EQ(utf8_prefix_length(text.data(), text.size(), 0), 0u);
}

TEST(CommandRunner, CapNeverSplitsACharacter) {
    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", "printf 'ab\\342\\202\\254cd'"};
    spec.max_output = 4;
    CommandResult result = run_command(spec);
    EXPECT_EQ(result.stdout_text, "ab");
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(CommandRunner, CapturesBothStreams) {
    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", "echo out; echo err >&2; exit 2"};
    CommandResult result = run_command(spec);

    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_TRUE(result.error.empty());
}

TEST(CommandRunner, MissingProgramExitsWith127) {
    CommandSpec spec;
    spec.argv = {"/nonexistent/program"};
    CommandResult result = run_command(spec);
    EXPECT_EQ(result.exit_code, 127);

    spec.argv.clear();
    EXPECT_FALSE(run_command(spec).started);
}
