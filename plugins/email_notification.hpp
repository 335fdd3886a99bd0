#pragma once

#include "plugin.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stavily::plugins {

struct EmailAttachment {
    std::string filename;               // base name shown to the recipient
    std::string content;
};

struct EmailMessage {
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    std::string subject;
    std::string body;
    std::string html_body;
    std::vector<EmailAttachment> attachments;
};

/// Read the files to attach. Paths that are not readable regular files are
/// skipped with a warning.
std::vector<EmailAttachment> load_attachments(const std::vector<std::string>& paths);

std::string base64_encode(const std::string& data);

/// RFC 5322 text for sendmail -t. Bcc recipients go in a Bcc header, which
/// sendmail strips before delivery. Attachments wrap the body in
/// multipart/mixed with base64 parts.
std::string render_message(const EmailMessage& message, const std::string& message_id);

/**
 * Action plugin sending email notifications. In demo mode nothing leaves the
 * process; otherwise the message is piped to a sendmail-compatible binary.
 */
class EmailNotification : public Plugin, public ActionCapable {
public:
    const PluginDescriptor& descriptor() const override;
    ConfigSchema config_schema() const override;
    void on_initialize(const Json& config, const RuntimeOptions& options) override;
    void collect_health(HealthReporter& reporter) const override;

    ConfigSchema parameter_schema() const override;
    ActionResult execute_action(const ActionRequest& request) override;
    std::chrono::seconds suggested_timeout() const override { return std::chrono::seconds(60); }

private:
    ActionResult send(const ActionRequest& request, const EmailMessage& message, const std::string& message_id);

    bool demo_mode_ = true;
    std::string sendmail_path_ = "/usr/sbin/sendmail";
    std::string from_email_;
    uint64_t sent_ = 0;
    uint64_t failed_ = 0;
};

} // namespace stavily::plugins
