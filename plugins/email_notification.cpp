#include "email_notification.hpp"

#include "command_runner.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "system_info.hpp"

#include <log4cplus/loggingmacros.h>

#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

namespace stavily::plugins {

namespace {

std::vector<std::string> string_values(const Json& parameters, const char* key) {
    std::vector<std::string> result;
    auto it = parameters.find(key);
    if (it == parameters.end() || it->is_null()) {
        return result;
    }
    if (it->is_string()) {
        result.push_back(it->get<std::string>());
        return result;
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw PluginError::validation(std::string("'") + key + "' must contain strings only");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::string optional_text(const Json& parameters, const char* key) {
    auto it = parameters.find(key);
    return it != parameters.end() && it->is_string() ? it->get<std::string>() : std::string();
}

bool has_header_break(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

std::string base_name(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    // Keep the name usable inside a quoted header parameter
    std::string safe;
    for (char c : name) {
        if (c != '"' && c != '\\' && c != '\r' && c != '\n') {
            safe += c;
        }
    }
    return safe.empty() ? "attachment" : safe;
}

std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item;
    }
    return result;
}

void write_body(std::ostream& out, const EmailMessage& message, const std::string& message_id) {
    if (message.html_body.empty()) {
        out << "Content-Type: text/plain; charset=utf-8\n\n" << message.body << "\n";
        return;
    }

    const std::string boundary = "stavily-" + message_id;
    out << "Content-Type: multipart/alternative; boundary=\"" << boundary << "\"\n\n";
    out << "--" << boundary << "\nContent-Type: text/plain; charset=utf-8\n\n" << message.body << "\n";
    out << "--" << boundary << "\nContent-Type: text/html; charset=utf-8\n\n" << message.html_body << "\n";
    out << "--" << boundary << "--\n";
}

} // namespace

std::string base64_encode(const std::string& data) {
    static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16 | static_cast<uint8_t>(data[i + 1]) << 8 |
                     static_cast<uint8_t>(data[i + 2]);
        encoded += kAlphabet[n >> 18 & 0x3f];
        encoded += kAlphabet[n >> 12 & 0x3f];
        encoded += kAlphabet[n >> 6 & 0x3f];
        encoded += kAlphabet[n & 0x3f];
    }
    if (i < data.size()) {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint8_t>(data[i + 1]) << 8;
        }
        encoded += kAlphabet[n >> 18 & 0x3f];
        encoded += kAlphabet[n >> 12 & 0x3f];
        encoded += i + 1 < data.size() ? kAlphabet[n >> 6 & 0x3f] : '=';
        encoded += '=';
    }
    return encoded;
}

std::vector<EmailAttachment> load_attachments(const std::vector<std::string>& paths) {
    std::vector<EmailAttachment> attachments;
    for (const auto& path : paths) {
        struct stat info {};
        if (::stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
            LOG4CPLUS_WARN(plugin_logger(), "Skipping attachment '" << path << "': not a regular file");
            continue;
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            LOG4CPLUS_WARN(plugin_logger(), "Skipping attachment '" << path << "': not readable");
            continue;
        }
        std::ostringstream content;
        content << file.rdbuf();
        attachments.push_back(EmailAttachment{base_name(path), content.str()});
    }
    return attachments;
}

std::string render_message(const EmailMessage& message, const std::string& message_id) {
    std::ostringstream out;
    out << "From: " << message.from << "\n";
    out << "To: " << join(message.to) << "\n";
    if (!message.cc.empty()) {
        out << "Cc: " << join(message.cc) << "\n";
    }
    if (!message.bcc.empty()) {
        out << "Bcc: " << join(message.bcc) << "\n";
    }
    out << "Subject: " << message.subject << "\n";
    out << "Message-ID: <" << message_id << ">\n";
    out << "MIME-Version: 1.0\n";

    if (message.attachments.empty()) {
        write_body(out, message, message_id);
        return out.str();
    }

    const std::string boundary = "stavily-mixed-" + message_id;
    out << "Content-Type: multipart/mixed; boundary=\"" << boundary << "\"\n\n";
    out << "--" << boundary << "\n";
    write_body(out, message, message_id);
    for (const auto& attachment : message.attachments) {
        out << "--" << boundary << "\n";
        out << "Content-Type: application/octet-stream; name=\"" << attachment.filename << "\"\n";
        out << "Content-Transfer-Encoding: base64\n";
        out << "Content-Disposition: attachment; filename=\"" << attachment.filename << "\"\n\n";
        std::string encoded = base64_encode(attachment.content);
        for (size_t pos = 0; pos < encoded.size(); pos += 76) {
            out << encoded.substr(pos, 76) << "\n";
        }
    }
    out << "--" << boundary << "--\n";
    return out.str();
}

const PluginDescriptor& EmailNotification::descriptor() const {
    static const PluginDescriptor descriptor{
        "email-notification",
        "Email Notification",
        "Sends email notifications for alerts, reports, and automation updates",
        "1.0.0",
        "Stavily Team",
        {Capability::Action},
        {"notification", "email", "alert", "communication"},
    };
    return descriptor;
}

ConfigSchema EmailNotification::config_schema() const {
    ConfigSchema schema("Email delivery configuration");
    schema.add("sendmail_path", ParamType::String, "sendmail-compatible binary used outside demo mode")
        .defaults_to("/usr/sbin/sendmail");
    schema.add("from_email", ParamType::String, "Sender address").defaults_to("stavily@" + hostname());
    return schema;
}

ConfigSchema EmailNotification::parameter_schema() const {
    ConfigSchema schema("Email notification configuration");
    schema.add("to", ParamType::StringOrArray, "Recipient email address(es)").required();
    schema.add("cc", ParamType::StringOrArray, "CC email address(es)");
    schema.add("bcc", ParamType::StringOrArray, "BCC email address(es)");
    schema.add("subject", ParamType::String, "Email subject line").required().longest(200);
    schema.add("body", ParamType::String, "Plain text email body");
    schema.add("html_body", ParamType::String, "HTML email body (optional)");
    schema.add("attachments", ParamType::Array, "List of file paths to attach");
    return schema;
}

void EmailNotification::on_initialize(const Json& config, const RuntimeOptions& options) {
    std::string sendmail = config.at("sendmail_path").get<std::string>();
    std::string from = config.at("from_email").get<std::string>();
    if (from.empty() || has_header_break(from)) {
        throw PluginError::validation("from_email must be a single non-empty address");
    }
    if (!options.demo_mode && ::access(sendmail.c_str(), X_OK) != 0) {
        throw PluginError::validation("sendmail_path '" + sendmail + "' is not executable");
    }

    demo_mode_ = options.demo_mode;
    sendmail_path_ = sendmail;
    from_email_ = from;
}

ActionResult EmailNotification::execute_action(const ActionRequest& request) {
    EmailMessage message;
    message.from = from_email_;
    message.to = string_values(request.parameters, "to");
    message.cc = string_values(request.parameters, "cc");
    message.bcc = string_values(request.parameters, "bcc");
    message.subject = optional_text(request.parameters, "subject");
    message.body = optional_text(request.parameters, "body");
    message.html_body = optional_text(request.parameters, "html_body");
    std::vector<std::string> attachment_paths = string_values(request.parameters, "attachments");

    if (message.to.empty()) {
        throw PluginError::validation("At least one recipient email is required");
    }
    if (has_header_break(message.subject)) {
        throw PluginError::validation("subject must be a single line");
    }
    for (const auto* list : {&message.to, &message.cc, &message.bcc}) {
        for (const auto& address : *list) {
            if (address.empty() || has_header_break(address)) {
                throw PluginError::validation("invalid email address '" + address + "'");
            }
        }
    }

    if (!demo_mode_) {
        message.attachments = load_attachments(attachment_paths);
    }

    std::string message_id = (demo_mode_ ? "demo-" : "") + request.id + "-" + std::to_string(epoch_seconds()) +
                             "@" + hostname();
    return send(request, message, message_id);
}

ActionResult EmailNotification::send(const ActionRequest& request, const EmailMessage& message,
                                     const std::string& message_id) {
    ActionResult result;
    result.id = request.id;
    result.metadata = Json{{"execution_host", hostname()}};

    Json output{
        {"recipients", message.to},
        {"cc", message.cc},
        {"bcc", message.bcc},
        {"subject", message.subject},
        {"message_id", message_id},
        {"attachments_count", request.parameters.value("attachments", Json::array()).size()},
        {"attached", message.attachments.size()},
        {"demo_mode", demo_mode_},
    };

    if (demo_mode_) {
        LOG4CPLUS_INFO(plugin_logger(), "DEMO: email to " << join(message.to) << " subject '" << message.subject << "'");
        result.status = "sent";
        result.output = output;
        ++sent_;
        return result;
    }

    CommandSpec spec;
    spec.argv = {sendmail_path_, "-t", "-i"};
    spec.input = render_message(message, message_id);
    spec.timeout = suggested_timeout();
    CommandResult sent = run_command(spec);

    if (sent.started && !sent.timed_out && sent.exit_code == 0) {
        LOG4CPLUS_INFO(plugin_logger(), "Email sent to " << message.to.size() << " recipient(s)");
        result.status = "sent";
        ++sent_;
    } else {
        std::string reason = sent.error;
        if (reason.empty()) {
            reason = "sendmail exited with code " + std::to_string(sent.exit_code);
            if (!sent.stderr_text.empty()) {
                reason += ": " + codec::to_valid_utf8(sent.stderr_text);
            }
        }
        LOG4CPLUS_ERROR(plugin_logger(), "Failed to send email: " << reason);
        result.status = "failed";
        result.error = reason;
        ++failed_;
    }
    result.output = output;
    return result;
}

void EmailNotification::collect_health(HealthReporter& reporter) const {
    if (demo_mode_) {
        reporter.add_check("transport", CheckResult::pass("demo mode, nothing is sent"));
    } else if (::access(sendmail_path_.c_str(), X_OK) == 0) {
        reporter.add_check("transport", CheckResult::pass(sendmail_path_ + " available"));
    } else {
        reporter.add_check("transport", CheckResult::fail(sendmail_path_ + " is not executable"));
    }

    reporter.set_metrics(Json{
        {"sendmail_path", demo_mode_ ? "demo" : sendmail_path_},
        {"from_email", from_email_},
        {"sent", sent_},
        {"failed", failed_},
    });
}

} // namespace stavily::plugins
