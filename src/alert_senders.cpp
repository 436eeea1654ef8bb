#include "../include/alert_senders.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <curl/curl.h>
#include <string.h>
#include <time.h>

struct UploadState {
    const std::string* data;
    size_t offset;
};

static size_t readPayload(char* ptr, size_t size, size_t nmemb, void* userdata) {
    UploadState* state = static_cast<UploadState*>(userdata);
    size_t room = size * nmemb;
    size_t left = state->data->size() - state->offset;
    size_t n = left < room ? left : room;
    memcpy(ptr, state->data->data() + state->offset, n);
    state->offset += n;
    return n;
}

static std::string rfc2822Date() {
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    char buf[64];
    strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &local);
    return std::string(buf);
}

SmtpEmailSender::SmtpEmailSender(const EmailConfig& config) : config_(config) {}

std::string SmtpEmailSender::buildMessage(const EmailConfig& config, const std::string& subject,
                                          const std::string& body, const std::string& date) {
    std::string to;
    for (size_t i = 0; i < config.to.size(); ++i) {
        if (i > 0) to += ", ";
        to += config.to[i];
    }
    std::string msg;
    msg += "Date: " + date + "\r\n";
    msg += "From: " + config.from + "\r\n";
    msg += "To: " + to + "\r\n";
    msg += "Subject: " + subject + "\r\n";
    msg += "Content-Type: text/plain; charset=utf-8\r\n";
    msg += "\r\n";
    // Bare LF in the body is not allowed on the wire
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\n' && (i == 0 || body[i - 1] != '\r')) msg += '\r';
        msg += body[i];
    }
    msg += "\r\n";
    return msg;
}

void SmtpEmailSender::sendEmail(const std::string& subject, const std::string& body) {
    std::string missing;
    if (!config_.isComplete(missing)) {
        Logger::warn("[Email] Missing %s, skipping email delivery", missing.c_str());
        return;
    }

    // 587 is the submission port with STARTTLS, anything else is implicit TLS
    std::string scheme = config_.port == 587 ? "smtp://" : "smtps://";
    std::string url = scheme + config_.host + ":" + std::to_string(config_.port);
    std::string message = buildMessage(config_, subject, body, rfc2822Date());
    UploadState upload = {&message, 0};

    CURL* curl = curl_easy_init();
    if (!curl) throw DeliveryException("curl_easy_init failed");

    struct curl_slist* recipients = nullptr;
    for (const auto& rcpt : config_.to) {
        recipients = curl_slist_append(recipients, rcpt.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, (long)CURLUSESSL_ALL);
    curl_easy_setopt(curl, CURLOPT_USERNAME, config_.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, config_.password.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, config_.from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readPayload);
    curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    CURLcode rc = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        throw DeliveryException(std::string("SMTP to ") + config_.host + " failed: " + curl_easy_strerror(rc));
    }
    Logger::info("[Email] Sent '%s' to %u recipient(s)", subject.c_str(), (unsigned)config_.to.size());
}

SmsGatewaySender::SmsGatewaySender(const SmsConfig& config, HttpClient* http)
    : config_(config), http_(http) {}

std::string SmsGatewaySender::buildRequestBody(const SmsConfig& config, const std::string& text) {
    DynamicJsonDocument doc(1024);
    JsonArray to = doc.createNestedArray("to");
    for (const auto& number : config.to) to.add(number);
    doc["message"] = text;
    std::string out;
    serializeJson(doc, out);
    return out;
}

void SmsGatewaySender::sendSms(const std::string& text) {
    std::string missing;
    if (!config_.isComplete(missing)) {
        Logger::warn("[SMS] Missing %s, skipping SMS delivery", missing.c_str());
        return;
    }

    std::string body = buildRequestBody(config_, text);
    HttpResponse resp;
    if (!config_.api_key.empty()) {
        std::string bearer = "Bearer " + config_.api_key;
        const char* keys[] = {"Authorization"};
        const char* values[] = {bearer.c_str()};
        resp = http_->post(config_.url.c_str(), body.c_str(), body.size(), "application/json", keys, values, 1);
    } else {
        resp = http_->post(config_.url.c_str(), body.c_str(), body.size(), "application/json");
    }

    if (!resp.error.empty()) {
        throw DeliveryException("SMS gateway unreachable: " + resp.error);
    }
    if (!resp.isSuccess()) {
        throw DeliveryException("SMS gateway returned HTTP " + std::to_string(resp.status_code));
    }
    Logger::info("[SMS] Sent to %u recipient(s)", (unsigned)config_.to.size());
}
