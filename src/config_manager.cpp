#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <cstdlib>
#include <fstream>
#include <iterator>

static const char* DEFAULT_CONFIG_PATH = "/etc/elemac/config.json";

// Upper bounds for numeric options
static const double MAX_USB_TIMEOUT_MS = 600000;   // 10 min
static const double MAX_PACKET_SIZE = 4096;
static const double MAX_POLL_INTERVAL_S = 86400;   // one day

// Options may be written as JSON strings or numbers; both are accepted.
static bool readString(JsonVariantConst v, std::string& out) {
    if (v.isNull()) return false;
    if (v.is<const char*>()) {
        std::string s = v.as<std::string>();
        if (s.empty()) return false;
        out = s;
        return true;
    }
    if (v.is<long>()) {
        out = std::to_string(v.as<long>());
        return true;
    }
    return false;
}

static bool readNumber(JsonVariantConst v, double& out) {
    if (v.isNull()) return false;
    if (v.is<double>() || v.is<long>()) {
        out = v.as<double>();
        return true;
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        char* end = nullptr;
        double d = strtod(s, &end);
        if (end == s || *end != '\0') return false;
        out = d;
        return true;
    }
    return false;
}

bool EmailConfig::isComplete(std::string& missing) const {
    if (host.empty()) { missing = "email_host"; return false; }
    if (user.empty()) { missing = "email_user"; return false; }
    if (password.empty()) { missing = "email_password"; return false; }
    if (to.empty()) { missing = "email_to"; return false; }
    return true;
}

bool SmsConfig::isComplete(std::string& missing) const {
    if (url.empty()) { missing = "sms_url"; return false; }
    if (to.empty()) { missing = "sms_to"; return false; }
    return true;
}

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager::ConfigManager(const char* config_file) {
    initializeDefaults();
    loadFromFile(config_file);
}

ConfigManager::~ConfigManager() {}

const char* ConfigManager::defaultConfigPath() { return DEFAULT_CONFIG_PATH; }

void ConfigManager::initializeDefaults() {
    // ELEMAC controllers enumerate with a Microchip vendor id
    device_config_.vendor_id = 0x04d8;
    device_config_.product_id = 0x003f;
    device_config_.timeout_ms = 1000;
    device_config_.max_packet_size = 64;

    email_config_ = EmailConfig();
    email_config_.port = 465;

    sms_config_ = SmsConfig();

    alert_config_.has_suppression_window = false;
    alert_config_.suppression_hours = 0.0;

    storage_config_.alert_state_dir = "/tmp";
    storage_config_.chart_data_file = "/var/lib/elemac/chart_data.jsonl";

    acquisition_config_.poll_interval_s = 60;

    logging_config_.log_level = "INFO";
    logging_config_.log_file = "";
    logging_config_.flush_on_write = true;
}

bool ConfigManager::loadFromFile(const char* config_file) {
    std::ifstream in(config_file);
    if (!in) {
        Logger::info("[ConfigMgr] No config file at %s, using defaults", config_file);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!loadFromString(json)) {
        Logger::error("[ConfigMgr] Ignoring malformed config file %s", config_file);
        return false;
    }
    Logger::debug("[ConfigMgr] Loaded %s", config_file);
    return true;
}

bool ConfigManager::loadFromString(const std::string& json) {
    DynamicJsonDocument doc(4096);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        Logger::error("[ConfigMgr] JSON parse error: %s", error.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        Logger::error("[ConfigMgr] Config root must be a JSON object");
        return false;
    }

    initializeDefaults();
    JsonObjectConst root = doc.as<JsonObjectConst>();
    std::string s;
    double d = 0;

    readString(root["email_host"], email_config_.host);
    if (readNumber(root["email_port"], d)) {
        if (d > 0 && d < 65536) email_config_.port = (uint16_t)d;
        else Logger::warn("[ConfigMgr] email_port out of range, keeping %u", email_config_.port);
    }
    readString(root["email_user"], email_config_.user);
    readString(root["email_password"], email_config_.password);
    readString(root["email_from"], email_config_.from);
    if (readString(root["email_to"], s)) email_config_.to = splitList(s);
    if (email_config_.from.empty()) email_config_.from = email_config_.user;

    readString(root["sms_url"], sms_config_.url);
    readString(root["sms_api_key"], sms_config_.api_key);
    if (readString(root["sms_to"], s)) sms_config_.to = splitList(s);

    if (!root["alert_dedup_suppression_hours"].isNull()) {
        if (readNumber(root["alert_dedup_suppression_hours"], d) && d >= 0) {
            alert_config_.has_suppression_window = true;
            alert_config_.suppression_hours = d;
        } else {
            Logger::warn("[ConfigMgr] Invalid alert_dedup_suppression_hours, dedup disabled");
        }
    }

    readString(root["alert_state_dir"], storage_config_.alert_state_dir);
    readString(root["chart_data_file"], storage_config_.chart_data_file);

    if (readNumber(root["usb_timeout_ms"], d)) {
        if (d >= 1 && d <= MAX_USB_TIMEOUT_MS) device_config_.timeout_ms = (uint32_t)d;
        else Logger::warn("[ConfigMgr] usb_timeout_ms out of range, keeping %u", device_config_.timeout_ms);
    }
    if (readNumber(root["max_packet_size"], d)) {
        if (d >= 1 && d <= MAX_PACKET_SIZE) device_config_.max_packet_size = (size_t)d;
        else Logger::warn("[ConfigMgr] max_packet_size out of range, keeping %u", (unsigned)device_config_.max_packet_size);
    }
    if (readNumber(root["poll_interval_s"], d)) {
        if (d >= 1 && d <= MAX_POLL_INTERVAL_S) acquisition_config_.poll_interval_s = (uint32_t)d;
        else Logger::warn("[ConfigMgr] poll_interval_s out of range, keeping %u", acquisition_config_.poll_interval_s);
    }

    readString(root["log_level"], logging_config_.log_level);
    readString(root["log_file"], logging_config_.log_file);
    return true;
}

std::vector<std::string> ConfigManager::splitList(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string item = list.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
        start = comma + 1;
    }
    return out;
}

DeviceConfig ConfigManager::getDeviceConfig() const { return device_config_; }
EmailConfig ConfigManager::getEmailConfig() const { return email_config_; }
SmsConfig ConfigManager::getSmsConfig() const { return sms_config_; }
AlertConfig ConfigManager::getAlertConfig() const { return alert_config_; }
StorageConfig ConfigManager::getStorageConfig() const { return storage_config_; }
AcquisitionConfig ConfigManager::getAcquisitionConfig() const { return acquisition_config_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
