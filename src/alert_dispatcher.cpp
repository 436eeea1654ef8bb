#include "../include/alert_dispatcher.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <stdio.h>

AlertDispatcher::AlertDispatcher(AlertDeduplicator* dedup, EmailDelivery* email, SmsDelivery* sms)
    : dedup_(dedup), email_(email), sms_(sms) {}

std::string AlertDispatcher::suppressionNote(double hours) {
    char buf[128];
    snprintf(buf, sizeof(buf), "Repeated alerts on this channel are suppressed for the next %g hour(s).", hours);
    return std::string(buf);
}

bool AlertDispatcher::raise(const std::string& summary, const std::string& details,
                            const std::string& brief, const std::string& channel) {
    return raise(summary, details, brief, channel, nowMicros());
}

bool AlertDispatcher::raise(const std::string& summary, const std::string& details,
                            const std::string& brief, const std::string& channel, TimePoint now) {
    const std::string& sms_text = brief.empty() ? summary : brief;

    if (dedup_ && dedup_->shouldSuppress(channel, now)) {
        Logger::info("[Alert] Suppressed '%s' on channel %s", summary.c_str(), channel.c_str());
        return false;
    }

    std::string body = details;
    if (dedup_ && dedup_->hasWindow() && !channel.empty()) {
        body += "\n\n" + suppressionNote(dedup_->windowHours());
    }

    Logger::warn("[Alert] %s", summary.c_str());

    if (email_) {
        try {
            email_->sendEmail(summary, body);
        } catch (const DeliveryException& e) {
            Logger::error("[Alert] Email delivery failed: %s", e.what());
        }
    }
    if (sms_) {
        try {
            sms_->sendSms(sms_text);
        } catch (const DeliveryException& e) {
            Logger::error("[Alert] SMS delivery failed: %s", e.what());
        }
    }

    if (dedup_) {
        try {
            dedup_->recordAlertSent(channel, now);
        } catch (const ConfigException& e) {
            Logger::error("[Alert] Could not record alert time: %s", e.what());
        }
    }
    return true;
}
