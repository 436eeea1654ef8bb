#pragma once
#include "alert_dispatcher.hpp"
#include "config_manager.hpp"
#include "http_client.hpp"
#include <string>

/**
 * Email over SMTPS (implicit TLS on email_port, 465 by default).
 *
 * Incomplete settings skip delivery with a warning instead of failing.
 */
class SmtpEmailSender : public EmailDelivery {
public:
    explicit SmtpEmailSender(const EmailConfig& config);
    void sendEmail(const std::string& subject, const std::string& body) override;

    // RFC 5322 message text sent to the server.
    static std::string buildMessage(const EmailConfig& config, const std::string& subject,
                                    const std::string& body, const std::string& date);

private:
    EmailConfig config_;
};

/**
 * SMS through an HTTP gateway: POST {"to": [...], "message": "..."} to sms_url.
 */
class SmsGatewaySender : public SmsDelivery {
public:
    SmsGatewaySender(const SmsConfig& config, HttpClient* http);
    void sendSms(const std::string& text) override;

    static std::string buildRequestBody(const SmsConfig& config, const std::string& text);

private:
    SmsConfig config_;
    HttpClient* http_;
};
