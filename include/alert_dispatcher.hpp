#pragma once
#include "alert_deduplicator.hpp"
#include "time_format.hpp"
#include <string>

// Delivery collaborators; both throw DeliveryException on failure.
class EmailDelivery {
public:
    virtual ~EmailDelivery() {}
    virtual void sendEmail(const std::string& subject, const std::string& body) = 0;
};

class SmsDelivery {
public:
    virtual ~SmsDelivery() {}
    virtual void sendSms(const std::string& text) = 0;
};

class AlertDispatcher {
public:
    // Either delivery collaborator may be null.
    AlertDispatcher(AlertDeduplicator* dedup, EmailDelivery* email, SmsDelivery* sms);

    /**
     * Deliver an alert unless the channel is inside its suppression window.
     *
     * An empty brief falls back to the summary. Each delivery failure is
     * logged and does not stop the other channel or the dedup record.
     *
     * @return true if delivery was attempted
     */
    bool raise(const std::string& summary, const std::string& details,
               const std::string& brief, const std::string& channel);
    bool raise(const std::string& summary, const std::string& details,
               const std::string& brief, const std::string& channel, TimePoint now);

    static std::string suppressionNote(double hours);

private:
    AlertDeduplicator* dedup_;
    EmailDelivery* email_;
    SmsDelivery* sms_;
};
